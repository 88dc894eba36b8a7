#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <langextract/config/engine_config.h>
#include <langextract/core/format.h>
#include <langextract/document/schema.h>
#include <langextract/engine/batch_runner.h>
#include <langextract/engine/extraction_engine.h>
#include <langextract/providers/provider_registry.h>
#include <langextract/providers/replay_provider.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

using namespace langextract;

namespace {

struct CommonArgs {
    std::string task;
    std::vector<std::string> replayFiles;
    std::string modelId = "replay";
    std::string schemaFile;
    std::string examplesFile;
    int passes = 0;
    int retries = -1;
    bool validate = false;
    bool fullResponse = false;
};

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, format("cannot open {}", path.string())};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Result<json> readJsonFile(const fs::path& path) {
    auto content = readFile(path);
    if (!content) {
        return content.error();
    }
    try {
        return json::parse(content.value());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, format("{}: {}", path.string(), e.what())};
    }
}

Result<std::shared_ptr<engine::ProviderGateway>>
buildGateway(const CommonArgs& args, const config::EngineConfig& cfg) {
    providers::ProviderRegistry registry;
    providers::registerReplayProvider(registry);

    auto gateway = std::make_shared<engine::ProviderGateway>(cfg.gateway);
    int priority = 0;
    for (const auto& file : args.replayFiles) {
        providers::ProviderSettings settings;
        settings.name = fs::path(file).stem().string();
        settings.modelId = args.modelId;
        settings.options = {{"file", file}};
        auto model = registry.createForModel(args.modelId, settings);
        if (!model) {
            return model.error();
        }
        if (auto added = gateway->addProvider(model.value(), priority++); !added) {
            return added.error();
        }
    }
    return gateway;
}

Result<engine::ExtractionRequest> buildRequest(const CommonArgs& args,
                                               const std::string& inputFile) {
    auto text = readFile(inputFile);
    if (!text) {
        return text.error();
    }

    engine::ExtractionRequest request;
    request.text = std::move(text).value();
    request.taskDescription = args.task;
    request.modelId = args.modelId;
    request.validateOutput = args.validate;
    if (args.passes > 0) {
        request.extractionPasses = args.passes;
    }
    if (args.retries >= 0) {
        request.retryCount = args.retries;
    }

    if (!args.schemaFile.empty()) {
        auto j = readJsonFile(args.schemaFile);
        if (!j) {
            return j.error();
        }
        auto schema = document::BasicExtractionSchema::fromJson(j.value());
        if (!schema) {
            return schema.error();
        }
        request.schema =
            std::make_shared<document::BasicExtractionSchema>(std::move(schema).value());
        request.validateOutput = true;
    }

    if (!args.examplesFile.empty()) {
        auto j = readJsonFile(args.examplesFile);
        if (!j) {
            return j.error();
        }
        if (!j.value().is_array()) {
            return Error{ErrorCode::InvalidData,
                         format("{}: examples must be a JSON array", args.examplesFile)};
        }
        for (const auto& item : j.value()) {
            auto example = document::exampleFromJson(item);
            if (!example) {
                return example.error();
            }
            request.examples.push_back(std::move(example).value());
        }
    }
    return request;
}

json renderResponse(const engine::ExtractionResponse& response, bool full) {
    if (full || !response.annotatedDocument) {
        return response.toJson();
    }
    return response.annotatedDocument->toJson();
}

Result<void> writeOutput(const std::string& outputFile, const json& j) {
    if (outputFile.empty()) {
        std::cout << j.dump(2) << std::endl;
        return {};
    }
    std::ofstream out(outputFile);
    if (!out) {
        return Error{ErrorCode::InvalidArgument, format("cannot write {}", outputFile)};
    }
    out << j.dump(2) << '\n';
    return {};
}

void configureLogging(const config::EngineConfig& cfg, bool verbose, const std::string& logFile) {
    if (!logFile.empty()) {
        try {
            auto logger = spdlog::basic_logger_mt("langextract", logFile);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to open log file " << logFile << ": " << e.what() << std::endl;
        }
    }
    spdlog::set_level(verbose ? spdlog::level::debug : cfg.logLevel);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.message << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Structured information extraction from unstructured text", "langextract"};
    app.set_version_flag("--version", "0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    std::string configFile;
    std::string logFile;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_option("-c,--config", configFile, "Configuration file (TOML)");
    app.add_option("--log-file", logFile, "Write logs to this file instead of stderr");

    CommonArgs common;
    auto addCommon = [&common](CLI::App* cmd) {
        cmd->add_option("-t,--task", common.task, "Extraction task description")->required();
        cmd->add_option("-r,--replay", common.replayFiles,
                        "Recorded model replies (JSON); repeat to add failover providers")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("-m,--model", common.modelId, "Model id")->default_val("replay");
        cmd->add_option("-s,--schema", common.schemaFile, "Extraction schema (JSON)")
            ->check(CLI::ExistingFile);
        cmd->add_option("-e,--examples", common.examplesFile, "Few-shot examples (JSON array)")
            ->check(CLI::ExistingFile);
        cmd->add_option("-p,--passes", common.passes, "Extraction passes (0 = automatic)")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--retries", common.retries, "Retries per provider");
        cmd->add_flag("--validate", common.validate, "Validate extractions against the schema");
        cmd->add_flag("--full", common.fullResponse, "Print the full response with debug trace");
    };

    auto* extractCmd = app.add_subcommand("extract", "Extract entities from one document");
    std::string inputFile;
    std::string outputFile;
    extractCmd->add_option("-i,--input", inputFile, "Input text file")
        ->required()
        ->check(CLI::ExistingFile);
    extractCmd->add_option("-o,--output", outputFile, "Write JSON here instead of stdout");
    addCommon(extractCmd);

    auto* batchCmd = app.add_subcommand("batch", "Extract entities from many documents");
    std::vector<std::string> inputFiles;
    std::string outputDir;
    int concurrency = 4;
    int maxErrors = 0;
    batchCmd->add_option("-i,--inputs", inputFiles, "Input text files")
        ->required()
        ->check(CLI::ExistingFile);
    batchCmd->add_option("-o,--output-dir", outputDir, "Write one <input>.json per document");
    batchCmd->add_option("-j,--concurrency", concurrency, "Documents processed at once")
        ->default_val(4)
        ->check(CLI::PositiveNumber);
    batchCmd->add_option("--max-errors", maxErrors, "Stop submitting after this many failures")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);
    addCommon(batchCmd);

    CLI11_PARSE(app, argc, argv);

    auto cfg = config::resolveEngineConfig(configFile);
    if (!cfg) {
        return fail(cfg.error());
    }
    configureLogging(cfg.value(), verbose, logFile);

    auto gateway = buildGateway(common, cfg.value());
    if (!gateway) {
        return fail(gateway.error());
    }
    engine::ExtractionEngine extractor(cfg.value().engine, gateway.value());

    if (*extractCmd) {
        auto request = buildRequest(common, inputFile);
        if (!request) {
            return fail(request.error());
        }
        auto response = extractor.processExtraction(std::move(request).value());
        if (auto written = writeOutput(outputFile, renderResponse(response, common.fullResponse));
            !written) {
            return fail(written.error());
        }
        if (!response.isSuccessful()) {
            return fail(*response.error);
        }
        return 0;
    }

    std::vector<engine::ExtractionRequest> requests;
    requests.reserve(inputFiles.size());
    for (const auto& file : inputFiles) {
        auto request = buildRequest(common, file);
        if (!request) {
            return fail(request.error());
        }
        requests.push_back(std::move(request).value());
    }

    engine::BatchRunner runner(extractor, {concurrency, maxErrors});
    auto summary = runner.run(std::move(requests));

    json results = json::array();
    for (const auto& item : summary.items) {
        const auto& input = inputFiles[item.index];
        auto rendered = renderResponse(item.response, common.fullResponse);
        if (!outputDir.empty()) {
            std::error_code ec;
            fs::create_directories(outputDir, ec);
            auto target = fs::path(outputDir) / (fs::path(input).filename().string() + ".json");
            if (auto written = writeOutput(target.string(), rendered); !written) {
                return fail(written.error());
            }
        }
        json entry = {{"input", input}, {"submitted", item.submitted},
                      {"success", item.response.isSuccessful()}};
        if (item.response.error) {
            entry["error"] = item.response.error->message;
        }
        if (outputDir.empty()) {
            entry["result"] = std::move(rendered);
        }
        results.push_back(std::move(entry));
    }

    json report = {{"succeeded", summary.succeeded},
                   {"failed", summary.failed},
                   {"skipped", summary.skipped},
                   {"aborted", summary.aborted},
                   {"results", std::move(results)}};
    std::cout << report.dump(2) << std::endl;
    return summary.failed == 0 && summary.skipped == 0 ? 0 : 1;
}
