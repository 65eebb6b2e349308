#include "cfg/core.hpp"
#include "logger/spdlog_init.hpp"
#include "xorg/document.hpp"
#include "xorg/xorg_exception.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>

using namespace std;
using namespace xorgconf;

static void print_help()
{
    cout << "\nxorgconf-gen\n\n"
            "Options:\n"
            "  -h    This message\n"
            "  -c    Path to layout file (INI)\n"
            "  -o    Output file, overrides the output key of [general]\n"
            "  -p    Print the configuration to stdout instead of writing it\n"
         << endl;
}


int main(int argc, char *argv[])
{
    int ch = 0;
    const char *config_file = nullptr;
    const char *output_file = nullptr;
    bool print_only = false;

    if (argc == 1) {
        print_help();
        return EXIT_FAILURE;
    }

    while ((ch = getopt(argc, argv, "hc:o:p")) != -1) {
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 'o':
            output_file = optarg;
            break;
        case 'p':
            print_only = true;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    if (config_file == nullptr) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        logging::init_bootstrap_logging();

        // initialize configuration
        const auto config = cfg::parse<cfg::Config>(cfg::parseIniFile(config_file));
        logging::init_spdlog(config.general);

        const document doc = cfg::buildDocument(config);
        spdlog::debug("Layout {} describes {} sections", config_file, doc.size());

        if (print_only) {
            const auto content = doc.render();
            if (!content) {
                spdlog::warn("Layout {} describes no sections, nothing to print", config_file);
                return EXIT_FAILURE;
            }
            cout << *content;
            return EXIT_SUCCESS;
        }

        const string output = output_file != nullptr ? output_file : config.general.output;
        if (doc.write(output) == write_status::nothing_to_render) {
            spdlog::warn("Layout {} describes no sections, {} not written", config_file, output);
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    } catch (const cfg::cfg_exception &e) {
        spdlog::error("Configuration file error: {}", e.what());
    } catch (const render_exception &e) {
        spdlog::error("Render error: {}", e.what());
    } catch (const write_exception &e) {
        spdlog::error("Write error: {}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}
