// star_etl command line
//
//   star_etl <mapping.yaml> [output] [--config file.json] [--format nquads|trig]
//            [--metadata] [--report report.json]

#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <star_etl/config/engine_config.h>
#include <star_etl/output/serializer.h>
#include <star_etl/pipeline.h>
#include <star_etl/util/errors.h>

namespace {

struct CommandLine {
    std::string mapping_path;
    std::string output_path;
    std::string config_path;
    std::string format;
    std::string report_path;
    bool metadata = false;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <mapping.yaml> [output] [--config file.json] [--format nquads|trig]"
                 " [--metadata] [--report report.json]" << std::endl;
}

arrow::Result<CommandLine> ParseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](const std::string& flag) -> arrow::Result<std::string> {
            if (i + 1 >= argc) {
                return arrow::Status::Invalid(flag, " requires a value");
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            ARROW_ASSIGN_OR_RAISE(cmd.config_path, next_value(arg));
        } else if (arg == "--format") {
            ARROW_ASSIGN_OR_RAISE(cmd.format, next_value(arg));
        } else if (arg == "--report") {
            ARROW_ASSIGN_OR_RAISE(cmd.report_path, next_value(arg));
        } else if (arg == "--metadata") {
            cmd.metadata = true;
        } else if (arg.rfind("--", 0) == 0) {
            return arrow::Status::Invalid("Unknown option ", arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return arrow::Status::Invalid("Expected a mapping file and an optional output path");
    }
    cmd.mapping_path = positional[0];
    if (positional.size() == 2) {
        cmd.output_path = positional[1];
    }
    return cmd;
}

arrow::Status Run(const CommandLine& cmd) {
    star_etl::EngineConfig config;
    if (!cmd.config_path.empty()) {
        ARROW_ASSIGN_OR_RAISE(config, star_etl::LoadEngineConfig(cmd.config_path));
    }
    if (!cmd.format.empty()) {
        ARROW_ASSIGN_OR_RAISE(config.output_format, star_etl::ParseOutputFormat(cmd.format));
    }
    if (cmd.metadata) {
        config.emit_run_metadata = true;
    }

    ARROW_ASSIGN_OR_RAISE(auto result, star_etl::RunMappingFile(cmd.mapping_path, config));

    std::string output = cmd.output_path.empty()
        ? star_etl::DefaultOutputPath(cmd.mapping_path, result.spec, config.output_format)
        : cmd.output_path;
    ARROW_RETURN_NOT_OK(star_etl::WriteStatementsToFile(result.statements, output,
                                                        config.output_format,
                                                        result.spec.prefixes));

    if (!cmd.report_path.empty()) {
        std::ofstream report(cmd.report_path);
        if (!report) {
            return arrow::Status::IOError("Cannot write report ", cmd.report_path);
        }
        report << result.report.ToJson() << "\n";
    }

    std::cout << result.report.Summary() << std::endl;
    std::cout << "Output: " << output << " (" << result.statements.size()
              << " statements)" << std::endl;
    return arrow::Status::OK();
}

} // namespace

int main(int argc, char** argv) {
    auto cmd = ParseCommandLine(argc, argv);
    if (!cmd.ok()) {
        std::cerr << "Error: " << cmd.status().message() << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }

    auto status = Run(*cmd);
    if (!status.ok()) {
        auto kind = star_etl::GetErrorKind(status);
        std::cerr << "Error";
        if (kind.has_value()) {
            std::cerr << " [" << star_etl::ToString(*kind) << "]";
        }
        std::cerr << ": " << status.message() << std::endl;
        return 1;
    }
    return 0;
}
