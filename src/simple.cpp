#include <iostream>
#include <cstring>
#include <string>
#include "log.hpp"

using namespace tagsink;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -f <file>         Debug handler output file (default: /tmp/tagsink_debug.log)\n"
              << "  -d <policy>       Default delivery: always, unmatched, never (default: always)\n"
              << "  -u                Render timestamps in UTC\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    // Default parameters
    std::string output_file   = "/tmp/tagsink_debug.log";
    default_delivery delivery = default_delivery::always;
    bool utc                  = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { output_file = argv[++i]; }
        else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) { delivery = default_delivery_from_string(argv[++i]); }
        else if (strcmp(argv[i], "-u") == 0) { utc = true; }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try
    {
        logger log{{
            .handlers = {
                {.name = "debug", .tags = {"debug"}, .target = {.filename = output_file}, .formatter = {.utc = utc}},
                {.name = "db", .tags = {"sql", "blog", "warning"}, .target = {.to_stderr = true}, .formatter = {.utc = utc}},
            },
            .delivery = delivery,
        }};

        std::cerr << "default delivery: " << string_from_default_delivery(log.delivery()) << "\n";

        log("Hello World");
        log.emit("cache warmed", "debug");
        log.emit("slow query", "blog", "sql");
        log.emit("unrouted", "metrics");

        TLOG(log, "debug", "trace") << "debug line with call site";
        TLOG(log).format("{} handlers configured", log.handlers().size());
    }
    catch (const log_error &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
