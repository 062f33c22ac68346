/**
 * @file pdftrust_verify.cpp
 * @brief Command line front end for PDF signature validation and RFC 3161 timestamping
 *
 * Usage:
 *   pdftrust-verify <file.pdf>              Validate a PDF, print the JSON report
 *   pdftrust-verify --timestamp <file>      Timestamp a file through the configured TSAs
 *
 * Exit codes: 0 valid, 1 invalid, 2 usage or configuration error.
 */

#include <pdftrust/common/exceptions.h>
#include <pdftrust/common/logger.h>
#include <pdftrust/engine/pdf_validation_engine.h>
#include <pdftrust/tsp/timestamp_server_manager.h>
#include <pdftrust/validation/certificate_manager.h>
#include <pdftrust/validation/crl_checker.h>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

int parseIntSetting(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw pdftrust::common::ConfigException(std::string(name) + " must be an integer, got '" +
                                                value + "'");
    }
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        size_t begin = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}

std::string readTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw pdftrust::common::ConfigException("cannot open " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<uint8_t> readBinaryFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw pdftrust::common::ConfigException("cannot open " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Tool configuration
 */
struct AppConfig {
    std::string trustedRootsPath;
    std::vector<std::string> tsaUrls;
    std::string tsaUsername;
    std::string tsaPassword;
    int tsaTimeoutMs = 30000;
    int tsaRetryAttempts = 3;
    std::string crlPath;

    std::string logLevel = "warn";
    std::string logFile;

    static AppConfig fromEnvironment() {
        AppConfig config;

        if (auto val = std::getenv("PDFTRUST_TRUSTED_ROOTS")) config.trustedRootsPath = val;
        if (auto val = std::getenv("PDFTRUST_TSA_URLS")) config.tsaUrls = splitList(val);
        if (auto val = std::getenv("PDFTRUST_TSA_USERNAME")) config.tsaUsername = val;
        if (auto val = std::getenv("PDFTRUST_TSA_PASSWORD")) config.tsaPassword = val;
        if (auto val = std::getenv("PDFTRUST_TSA_TIMEOUT_MS")) {
            config.tsaTimeoutMs = parseIntSetting("PDFTRUST_TSA_TIMEOUT_MS", val);
        }
        if (auto val = std::getenv("PDFTRUST_TSA_RETRY_ATTEMPTS")) {
            config.tsaRetryAttempts = parseIntSetting("PDFTRUST_TSA_RETRY_ATTEMPTS", val);
        }
        if (auto val = std::getenv("PDFTRUST_CRL_PATH")) config.crlPath = val;

        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        if (config.tsaTimeoutMs <= 0) {
            throw pdftrust::common::ConfigException("PDFTRUST_TSA_TIMEOUT_MS must be positive");
        }
        if (config.tsaRetryAttempts < 1) {
            throw pdftrust::common::ConfigException("PDFTRUST_TSA_RETRY_ATTEMPTS must be at least 1");
        }
        return config;
    }

    pdftrust::tsp::TSAConfig tsaConfig(const std::string& url) const {
        pdftrust::tsp::TSAConfig tsa;
        tsa.url = url;
        tsa.username = tsaUsername;
        tsa.password = tsaPassword;
        tsa.timeoutMs = tsaTimeoutMs;
        tsa.retryAttempts = tsaRetryAttempts;
        return tsa;
    }
};

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " <file.pdf>\n"
              << "  " << program << " --timestamp <file>\n\n"
              << "Environment:\n"
              << "  PDFTRUST_TRUSTED_ROOTS       PEM bundle of trusted root certificates\n"
              << "  PDFTRUST_CRL_PATH            PEM file with CRLs for revocation checks\n"
              << "  PDFTRUST_TSA_URLS            Comma separated TSA URLs, first is primary\n"
              << "  PDFTRUST_TSA_USERNAME        TSA basic auth user\n"
              << "  PDFTRUST_TSA_PASSWORD        TSA basic auth password\n"
              << "  PDFTRUST_TSA_TIMEOUT_MS      Per-request timeout (default 30000)\n"
              << "  PDFTRUST_TSA_RETRY_ATTEMPTS  Attempts per TSA (default 3)\n"
              << "  LOG_LEVEL, LOG_FILE          Diagnostics on stderr and optional log file\n";
}

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

int runValidation(const AppConfig& config, const std::string& path) {
    using namespace pdftrust;

    engine::EngineOptions options;
    if (!config.trustedRootsPath.empty()) {
        validation::CertificateManager certificates;
        for (const auto& root : certificates.loadFromPem(readTextFile(config.trustedRootsPath))) {
            certificates.addTrustedRoot(root);
        }
        options.trustedRoots = certificates.trustedRoots();
        spdlog::info("[Verify] Loaded {} trusted root(s) from {}",
                     options.trustedRoots.size(), config.trustedRootsPath);
    }

    std::unique_ptr<validation::PemCrlProvider> crlProvider;
    std::unique_ptr<validation::CrlChecker> crlChecker;
    if (!config.crlPath.empty()) {
        crlProvider = std::make_unique<validation::PemCrlProvider>(readTextFile(config.crlPath));
        crlChecker = std::make_unique<validation::CrlChecker>(crlProvider.get());
        options.revocationChecker = crlChecker.get();
        spdlog::info("[Verify] Loaded {} CRL(s) from {}", crlProvider->size(), config.crlPath);
    }

    engine::PdfValidationEngine validator(std::move(options));
    auto bytes = readBinaryFile(path);

    engine::PdfValidationResult result;
    try {
        result = validator.validatePdf(bytes);
    } catch (const std::invalid_argument& e) {
        // Signed documents need trust anchors
        throw common::ConfigException(std::string(e.what()) + " (set PDFTRUST_TRUSTED_ROOTS)");
    }

    printJson(result.toJson());
    return result.isValid ? EXIT_VALID : EXIT_INVALID;
}

int runTimestamp(const AppConfig& config, const std::string& path) {
    using namespace pdftrust;

    if (config.tsaUrls.empty()) {
        throw common::ConfigException("PDFTRUST_TSA_URLS is required for --timestamp");
    }

    tsp::TSAFailoverConfig failover;
    failover.primary = config.tsaConfig(config.tsaUrls.front());
    for (size_t i = 1; i < config.tsaUrls.size(); ++i) {
        failover.fallbacks.push_back(config.tsaConfig(config.tsaUrls[i]));
    }

    tsp::TimestampServerManager manager;
    auto data = readBinaryFile(path);
    auto request = manager.createTimestampRequest(data);

    tsp::TimestampResponse response;
    try {
        response = manager.requestTimestampWithFailover(request, failover);
    } catch (const common::PdfTrustException& e) {
        spdlog::error("[Verify] Timestamp request failed: {}", e.what());
        Json::Value report;
        report["granted"] = false;
        report["error"] = e.what();
        printJson(report);
        return EXIT_INVALID;
    }

    auto verification = manager.verifyTimestampResponse(response, data);

    Json::Value report;
    report["granted"] = response.status.isGranted();
    report["status"] = response.status.describe();
    report["tsaUrl"] = response.tsaUrl;
    if (response.token) {
        report["timestamp"] = tsp::TimestampServerManager::toTimestamp(*response.token, response.tsaUrl).toJson();
    }
    report["verification"] = verification.toJson();
    printJson(report);
    return verification.isValid ? EXIT_VALID : EXIT_INVALID;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string mode;
    std::string path;
    if (argc == 2 && std::string(argv[1]) != "--help" && std::string(argv[1]) != "-h") {
        path = argv[1];
    } else if (argc == 3 && std::string(argv[1]) == "--timestamp") {
        mode = "timestamp";
        path = argv[2];
    } else {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        AppConfig config = AppConfig::fromEnvironment();
        pdftrust::common::Logger::initialize("pdftrust-verify", config.logLevel,
                                             !config.logFile.empty(), config.logFile);

        if (mode == "timestamp") {
            return runTimestamp(config, path);
        }
        return runValidation(config, path);
    } catch (const pdftrust::common::ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const pdftrust::common::PdfTrustException& e) {
        spdlog::error("[Verify] {}", e.what());
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
