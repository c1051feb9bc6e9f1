/**
 * @file trace_demo.cpp
 * @brief Demo of call-site and exception capture with the "trace" tag
 */

#include "log.hpp"
#include <stdexcept>

using namespace tagsink;

namespace
{

void open_connection(int attempt)
{
    if (attempt < 3) { throw std::runtime_error("connection refused"); }
}

void connect()
{
    try
    {
        open_connection(1);
    }
    catch (...)
    {
        std::throw_with_nested(std::runtime_error("database unavailable"));
    }
}

} // namespace

int main()
{
    logger::init({
        .handlers = {
            {.name      = "trace",
             .tags      = {"trace"},
             .target    = {.to_stderr = true},
             .formatter = {.trace_template = "{file}{line}{module}", .prefix_template = "{datetime} {trace}{tags} "}},
        },
    });

    TLOG_DEFAULT("startup") << "tracing demo";

    for (int attempt = 1; attempt <= 3; ++attempt)
    {
        TLOG_DEFAULT("net", "trace") << "connecting, attempt " << attempt;
    }

    try
    {
        connect();
    }
    catch (const std::exception &)
    {
        // The nested exception chain is appended after the message
        TLOG_DEFAULT("db", "trace") << "giving up";
    }

    return 0;
}
