/**
 * @file datauri_tool.cpp
 * @brief Command line tool for creating and reading data: URIs
 *
 * This example shows how to:
 * 1. Build a data URI from a file with the fluent builder
 * 2. Decode a data URI back to its bytes
 * 3. Describe a decoded URI as JSON
 */

#include "datauri/builder.hpp"
#include "datauri/config.hpp"
#include "datauri/data_uri.hpp"
#include "datauri/json_serialization.hpp"
#include "datauri/logging.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <getopt.h>

using namespace datauri;

namespace {

enum class Mode { None, Encode, Decode, Inspect };

struct Options {
    Mode mode = Mode::None;
    std::string argument;
    std::optional<std::string> mime;
    std::optional<std::string> charset;
    std::optional<std::string> output;
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;
    bool text = false;
};

/**
 * @brief Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <operation> [options]\n";
    std::cout << "Operations:\n";
    std::cout << "  --encode, -e FILE     Print a data URI for FILE\n";
    std::cout << "  --decode, -d URI      Write the decoded bytes of URI\n";
    std::cout << "  --inspect, -i URI     Print a JSON description of URI\n";
    std::cout << "Options:\n";
    std::cout << "  --mime, -m TYPE       MIME type for --encode\n";
    std::cout << "  --charset, -c NAME    Charset parameter for --encode\n";
    std::cout << "  --text, -t            Percent-encode instead of base64\n";
    std::cout << "  --output, -o FILE     Destination for --decode (default stdout)\n";
    std::cout << "  --config FILE         Load JSON configuration\n";
    std::cout << "  --log-level LEVEL     trace, debug, info, warn, error, critical or off\n";
    std::cout << "  --help, -h            Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --encode logo.png --mime image/png\n";
    std::cout << "  " << program_name << " --encode notes.txt --mime text/plain --charset UTF-8 --text\n";
    std::cout << "  " << program_name << " --decode 'data:,hello+world'\n";
    std::cout << "  " << program_name << " --inspect 'data:;base64,SGVsbG8='\n";
}

int run_encode(const Options& options, const CodecConfig& config) {
    std::ifstream in(options.argument, std::ios::binary);
    if (!in) {
        throwIoError("open " + options.argument);
    }

    auto builder = DataUriBuilder::fromBytes(in, config);
    builder.withBase64Data(!options.text);

    std::string uri;
    if (options.mime || options.charset) {
        auto stage = builder.withMediaType(options.mime.value_or("text/plain"));
        if (options.charset) {
            stage.withCharset(*options.charset);
        }
        uri = stage.build();
    } else {
        uri = builder.build();
    }

    std::cout << uri << "\n";
    return 0;
}

int run_decode(const Options& options) {
    auto body = decodeUri(options.argument);
    const auto& content = body.content();

    if (options.output) {
        std::ofstream out(*options.output, std::ios::binary);
        if (!out) {
            throwIoError("open " + *options.output);
        }
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw IoError("failed to write " + *options.output);
        }
        DATAURI_LOG_INFO("Wrote {} bytes to {}", content.size(), *options.output);
    } else {
        std::cout.write(reinterpret_cast<const char*>(content.data()),
                        static_cast<std::streamsize>(content.size()));
        std::cout.flush();
    }
    return 0;
}

int run_inspect(const Options& options) {
    auto body = decodeUri(options.argument);
    std::cout << json_serialization::to_pretty_json(body) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;

    // Command line options
    static struct option long_options[] = {
        {"encode", required_argument, 0, 'e'},
        {"decode", required_argument, 0, 'd'},
        {"inspect", required_argument, 0, 'i'},
        {"mime", required_argument, 0, 'm'},
        {"charset", required_argument, 0, 'c'},
        {"text", no_argument, 0, 't'},
        {"output", required_argument, 0, 'o'},
        {"config", required_argument, 0, 'C'},
        {"log-level", required_argument, 0, 'L'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "e:d:i:m:c:to:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'e':
                options.mode = Mode::Encode;
                options.argument = optarg;
                break;
            case 'd':
                options.mode = Mode::Decode;
                options.argument = optarg;
                break;
            case 'i':
                options.mode = Mode::Inspect;
                options.argument = optarg;
                break;
            case 'm':
                options.mime = optarg;
                break;
            case 'c':
                options.charset = optarg;
                break;
            case 't':
                options.text = true;
                break;
            case 'o':
                options.output = optarg;
                break;
            case 'C':
                options.configPath = optarg;
                break;
            case 'L':
                options.logLevel = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case '?':
                print_usage(argv[0]);
                return 1;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (options.mode == Mode::None) {
        std::cerr << "No operation specified. Use --help for options.\n";
        return 1;
    }

    try {
        CodecConfig config;
        if (options.configPath) {
            config = CodecConfig::fromFile(*options.configPath);
        }
        if (options.logLevel) {
            config.logLevel = *options.logLevel;
        }
        config.apply();

        switch (options.mode) {
            case Mode::Encode:
                return run_encode(options, config);
            case Mode::Decode:
                return run_decode(options);
            case Mode::Inspect:
                return run_inspect(options);
            case Mode::None:
                break;
        }
    } catch (const DataUriError& e) {
        std::cerr << "Error [" << errorCodeToString(e.errorCode()) << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
