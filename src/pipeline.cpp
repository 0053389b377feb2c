#include <star_etl/pipeline.h>

#include <filesystem>
#include <star_etl/generation/executor.h>
#include <star_etl/generation/run_metadata.h>
#include <star_etl/mapping/yarrrml_parser.h>
#include <star_etl/util/logging.h>

namespace star_etl {

namespace fs = std::filesystem;

arrow::Result<PipelineResult> RunMappingFile(const std::string& mapping_path,
                                             const EngineConfig& config) {
    YarrrmlParser parser;
    ARROW_ASSIGN_OR_RAISE(auto spec, parser.ParseFile(mapping_path));

    const std::string mapping_dir = fs::path(mapping_path).parent_path().string();

    PipelineResult result;
    {
        GenerationExecutor executor(spec, config.ToExecutorOptions(mapping_dir));
        ARROW_ASSIGN_OR_RAISE(auto generated, executor.Run());
        result.statements = std::move(generated.statements);
        result.report = std::move(generated.report);
    }

    if (config.emit_run_metadata) {
        spec.prefixes.AddIfAbsent("dcat", std::string(vocab::kDcatNamespace));
        spec.prefixes.AddIfAbsent("dct", std::string(vocab::kDctNamespace));
        auto metadata = BuildRunMetadata(spec, fs::path(mapping_path).filename().string(),
                                         CurrentTimestampUtc());
        result.report.metadata_statements = metadata.size();
        for (auto& statement : metadata) {
            result.statements.push_back(std::move(statement));
        }
        STAR_ETL_LOG_EXECUTOR("Added " << metadata.size() << " run metadata statements");
    }

    result.spec = std::move(spec);
    return result;
}

std::string DefaultOutputPath(const std::string& mapping_path,
                              const MappingSpec& spec,
                              OutputFormat format) {
    fs::path mapping(mapping_path);
    fs::path dir = mapping.parent_path();

    if (!spec.targets.empty() && !spec.targets.front().access.empty()) {
        fs::path access(spec.targets.front().access);
        return (access.is_absolute() ? access : dir / access).string();
    }

    std::string file = mapping.stem().string() + "_output." + std::string(FileExtension(format));
    return (dir / "output" / file).string();
}

} // namespace star_etl
