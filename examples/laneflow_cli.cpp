#include <laneflow/laneflow.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace laneflow;
using json = nlohmann::json;

namespace {

struct CliOptions {
    std::optional<std::string> input;
    bool readStdin = false;
    std::optional<std::string> output;
    std::optional<std::string> style;
    std::optional<std::string> styleFile;
    std::string format = "drawio";
    bool validateOnly = false;
    bool listStyles = false;
    bool verbose = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [input.json | --stdin] [options]\n"
              << "  -o, --output PATH      Output file (default: diagrams/<title>.<ext>)\n"
              << "  -s, --style NAME       Style preset (default: classic)\n"
              << "      --style-file PATH  Load the style from a JSON file\n"
              << "  -f, --format FORMAT    drawio (default), svg or json\n"
              << "      --validate         Validate input only\n"
              << "      --list-styles      List style presets and exit\n"
              << "  -v, --verbose          Debug logging\n";
}

std::optional<CliOptions> parseArguments(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--stdin") {
            options.readStdin = true;
        } else if (arg == "--output" || arg == "-o") {
            if (!(options.output = next())) return std::nullopt;
        } else if (arg == "--style" || arg == "-s") {
            if (!(options.style = next())) return std::nullopt;
        } else if (arg == "--style-file") {
            if (!(options.styleFile = next())) return std::nullopt;
        } else if (arg == "--format" || arg == "-f") {
            auto value = next();
            if (!value) return std::nullopt;
            options.format = *value;
        } else if (arg == "--validate") {
            options.validateOnly = true;
        } else if (arg == "--list-styles") {
            options.listStyles = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            options.input = arg;
        }
    }

    if (options.format != "drawio" && options.format != "svg" && options.format != "json") {
        std::cerr << "Unknown format: " << options.format << "\n";
        return std::nullopt;
    }
    return options;
}

int listStyles() {
    json names = json::array();
    for (const auto& name : StylePalette::presetNames()) {
        std::cerr << "  " << name << ": " << StylePalette::preset(name).description() << "\n";
        names.push_back(name);
    }
    std::cout << json{{"styles", names}}.dump() << std::endl;
    return 0;
}

std::string defaultOutputPath(const std::string& title, const std::string& extension) {
    std::string stem = title.empty() ? "diagram" : title;
    std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char c) {
        return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
    });
    return (std::filesystem::path("diagrams") / (stem + "." + extension)).string();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    Logger::initialize();
    Logger::setLevel(options->verbose ? LogLevel::Debug : LogLevel::Warn);

    if (options->listStyles) {
        return listStyles();
    }

    // Read input
    json document;
    try {
        if (options->readStdin) {
            document = json::parse(std::cin);
        } else if (options->input) {
            std::ifstream file(*options->input);
            if (!file) {
                std::cerr << "Cannot open input file: " << *options->input << "\n";
                return 1;
            }
            document = json::parse(file);
        } else {
            std::cerr << "Either input file or --stdin required\n";
            printUsage(argv[0]);
            return 2;
        }
    } catch (const json::parse_error& e) {
        std::cerr << "Malformed JSON: " << e.what() << "\n";
        return 1;
    }

    // Style: --style-file > --style > document field > classic
    StylePalette palette;
    std::string styleName = "classic";
    try {
        if (options->styleFile) {
            palette = StylePalette::loadFile(*options->styleFile);
            styleName = *options->styleFile;
        } else {
            if (options->style) {
                styleName = *options->style;
            } else if (document.is_object() && document.contains("style") && document["style"].is_string()) {
                styleName = document["style"].get<std::string>();
            }
            palette = StylePalette::preset(styleName);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    const auto errors = DiagramLoader::validate(document);
    if (!errors.empty()) {
        std::cerr << "Validation errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return 1;
    }

    if (options->validateOnly) {
        std::cerr << "Input is valid\n";
        std::cout << json{{"valid", true},
                          {"nodes", document.value("nodes", json::array()).size()},
                          {"connections", document.value("connections", json::array()).size()}}.dump()
                  << std::endl;
        return 0;
    }

    Graph graph;
    try {
        DiagramDescriptor diagram = DiagramLoader::fromJson(document);
        SwimlaneLayout layout;
        graph = layout.layout(diagram);
    } catch (const StructuralInputError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const DiagramParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<IExporter> exporter;
    if (options->format == "svg") {
        exporter = std::make_unique<SvgExport>(palette);
    } else if (options->format == "drawio") {
        exporter = std::make_unique<DrawioExport>(palette);
    }

    const std::string extension = exporter ? exporter->fileExtension() : "json";
    const std::string outputPath = options->output.value_or(defaultOutputPath(graph.title(), extension));

    std::error_code ec;
    const auto parent = std::filesystem::path(outputPath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create directory " << parent.string() << ": " << ec.message() << "\n";
            return 1;
        }
    }

    const bool written = exporter ? exporter->exportToFile(graph, outputPath)
                                  : LayoutSerializer::saveToFile(graph, outputPath);
    if (!written) {
        std::cerr << "Cannot write " << outputPath << "\n";
        return 1;
    }

    std::cerr << "Generated: " << outputPath << " (style: " << styleName << ")\n";
    std::cout << json{{"output", outputPath},
                      {"style", styleName},
                      {"format", options->format},
                      {"nodes", graph.nodeCount()},
                      {"groups", graph.groupCount()},
                      {"connections", graph.edgeCount()},
                      {"canvas", {{"width", graph.canvasSize().width},
                                  {"height", graph.canvasSize().height}}}}.dump()
              << std::endl;
    return 0;
}
