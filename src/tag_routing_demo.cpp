/**
 * @file tag_routing_demo.cpp
 * @brief Demo of tag subscriptions, dynamic names and per-handler formats
 */

#include "log.hpp"
#include <iostream>

using namespace tagsink;

int main()
{
    logger log{{
        .handlers = {
            // Everything about the database, to stdout, only the tags it asked for
            {.name                = "db",
             .tags                = {"sql", "database"},
             .target              = {.to_stdout = true},
             .formatter           = {.prefix_template = "db {tags} | "},
             .render_matched_only = true},

            // Audit trail with its own layout and lowercase tags
            {.name      = "audit",
             .tags      = {"audit", "security"},
             .target    = {.filename = "/tmp/tagsink_audit.log"},
             .formatter = {.tag_formatter   = [](std::string_view tag) { return std::string(tag); },
                           .tag_delimiter   = " ",
                           .tags_template   = "<{tags}>",
                           .prefix_template = "{datetime} {handler} {tags} ",
                           .utc             = true}},
        },
        .delivery = default_delivery::unmatched,
    }};

    // Explicit tags
    log.emit("connection pool exhausted", "sql", "warning");
    log.emit("user admin logged in", "audit", "info");

    // Dynamic names
    log.invoke("sql_error", "deadlock detected");
    log["emit_security_warning"]("password retry limit reached");

    // Bound tags
    auto billing = log.tagged("billing");
    billing("invoice 1042 issued");
    billing.format("{} invoices pending", 3);

    // Identifier form at the call site
    TLOG_NAMED(log, database_info) << "vacuum finished in " << 812 << "ms";

    std::cout << "\n--- Demo complete ---" << std::endl;
    std::cout << "Check /tmp/tagsink_audit.log for audit and security lines" << std::endl;

    return 0;
}
