#include "assetcdn/deploy_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace assetcdn {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// "-releaseVersion" -> "--release-version"; "--Target-Device" -> "--target-device"
std::string normalize_flag(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-') return arg;
    if (arg[1] == '-') return lower(arg);

    std::string out = "--";
    for (size_t i = 1; i < arg.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(arg[i]);
        if (std::isupper(c) && i > 1 && arg[i - 1] != '-') out += '-';
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool parse_count(const char* name, const char* value, uint64_t& out) {
    try {
        size_t pos = 0;
        std::string v = value;
        out = std::stoull(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got '" << value << "'\n";
        return false;
    }
}

// Map a --backend-X flag with a value to a BackendConfig field.
bool parse_backend_flag(const std::string& suffix, const char* value, BackendConfig& backend) {
    static const std::map<std::string, std::string> names = {
        {"endpoint", "endpoint"},
        {"region", "region"},
        {"account-id", "account_id"},
        {"access-key", "access_key"},
        {"secret-key", "secret_key"},
        {"session-token", "session_token"},
        {"ca-bundle", "ca_bundle"},
        {"root", "root"},
        {"multipart-threshold", "multipart_threshold"},
        {"multipart-chunk-size", "multipart_chunk_size"},
        {"part-concurrency", "part_concurrency"},
        {"connect-timeout", "connect_timeout"},
    };
    if (suffix == "type") {
        backend.type = lower(value);
        return true;
    }
    auto it = names.find(suffix);
    if (it == names.end()) return false;
    backend.params[it->second] = value;
    return true;
}

bool is_backend_bool_flag(const std::string& arg) {
    return arg == "--backend-path-style" || arg == "--backend-no-verify-ssl" ||
           arg == "--backend-unsigned-payload";
}

void print_usage() {
    std::cerr <<
        "Usage: assetcdn-deploy --operation <op> [options]\n"
        "\n"
        "Operations:\n"
        "  upload                           Upload --build-path under --release-version (default)\n"
        "  delete                           Delete every object under --prefix\n"
        "  cleanup-multipart                Abort incomplete multipart uploads under --prefix\n"
        "  test-connection                  Check credentials and bucket visibility\n"
        "  latest-version                   Print the newest v<yyyyMMdd_HHmmss> prefix\n"
        "  copy                             Copy --source-prefix to --target-prefix\n"
        "\n"
        "Release:\n"
        "  --release-version <tag>          Version prefix for uploads (required for upload)\n"
        "  --target-device <device>         Quest, Mobile_Android, Mobile_iOS, PC (default: Quest)\n"
        "  --environment <env>              Development, Staging, Production (default: Development)\n"
        "  --prefix <prefix>                Scope for delete / cleanup-multipart / latest-version\n"
        "  --cleanup-multipart-uploads <b>  Sweep multipart uploads after upload (default: true)\n"
        "  --build-path <dir>               Directory to upload\n"
        "  --bucket <name>                  Override the profile bucket name\n"
        "  --source-prefix <prefix>         Copy source\n"
        "  --target-prefix <prefix>         Copy target\n"
        "  --platform-name <name>           Profile platform (default: android)\n"
        "  --product-name <name>            Profile product (default: product)\n"
        "  --cdn-url-<env> <url>            CDN URL for development, staging or production\n"
        "\n"
        "Upload tuning:\n"
        "  --upload-concurrency <N>         Files uploaded in parallel (default: 4)\n"
        "  --upload-timeout-minutes <N>     Overall upload timeout (default: 30)\n"
        "  --batch                          Unattended execution (default)\n"
        "  --interactive                    Interactive execution (shorter timeouts)\n"
        "  --request-timeout-minutes <N>    Per-request timeout (default: 30 batch, 10 interactive)\n"
        "  --max-error-retry <N>            Retries on transient errors (default: 5)\n"
        "\n"
        "Backend (--backend-*):\n"
        "  --backend-type <type>            r2 (default), s3, local\n"
        "  --backend-account-id <id>        Cloudflare account id (r2)\n"
        "  --backend-endpoint <url>         Endpoint URL (s3)\n"
        "  --backend-region <region>        Region (s3, default: us-east-1)\n"
        "  --backend-access-key <key>       Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --backend-secret-key <key>       Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --backend-session-token <token>  Session token (or AWS_SESSION_TOKEN env)\n"
        "  --backend-root <dir>             Root directory (local)\n"
        "  --backend-ca-bundle <path>       CA bundle for SSL\n"
        "  --backend-path-style             Path-style addressing (s3)\n"
        "  --backend-no-verify-ssl          Skip SSL verification\n"
        "  --backend-multipart-threshold <bytes>\n"
        "  --backend-multipart-chunk-size <bytes>\n"
        "  --backend-part-concurrency <N>\n"
        "\n"
        "General:\n"
        "  --config <path>                  JSON config file\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --log-file <path>                Append output to this file\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n"
        "\n"
        "Single-dash camelCase flags (-releaseVersion, -targetDevice) are accepted.\n";
}

}  // namespace

// --- Enums ---

const char* to_string(TargetDevice device) {
    switch (device) {
    case TargetDevice::Quest: return "Quest";
    case TargetDevice::Mobile_Android: return "Mobile_Android";
    case TargetDevice::Mobile_iOS: return "Mobile_iOS";
    case TargetDevice::PC: return "PC";
    }
    return "Quest";
}

const char* to_string(Environment environment) {
    switch (environment) {
    case Environment::Development: return "Development";
    case Environment::Staging: return "Staging";
    case Environment::Production: return "Production";
    }
    return "Development";
}

const char* to_string(Operation operation) {
    switch (operation) {
    case Operation::Upload: return "upload";
    case Operation::Delete: return "delete";
    case Operation::CleanupMultipart: return "cleanup-multipart";
    case Operation::TestConnection: return "test-connection";
    case Operation::LatestVersion: return "latest-version";
    case Operation::Copy: return "copy";
    }
    return "upload";
}

bool parse_target_device(const std::string& value, TargetDevice& out) {
    auto v = lower(value);
    if (v == "quest") out = TargetDevice::Quest;
    else if (v == "mobile_android") out = TargetDevice::Mobile_Android;
    else if (v == "mobile_ios") out = TargetDevice::Mobile_iOS;
    else if (v == "pc") out = TargetDevice::PC;
    else return false;
    return true;
}

bool parse_environment(const std::string& value, Environment& out) {
    auto v = lower(value);
    if (v == "development") out = Environment::Development;
    else if (v == "staging") out = Environment::Staging;
    else if (v == "production") out = Environment::Production;
    else return false;
    return true;
}

bool parse_operation(const std::string& value, Operation& out) {
    auto v = lower(value);
    if (v == "upload") out = Operation::Upload;
    else if (v == "delete") out = Operation::Delete;
    else if (v == "cleanup-multipart") out = Operation::CleanupMultipart;
    else if (v == "test-connection") out = Operation::TestConnection;
    else if (v == "latest-version") out = Operation::LatestVersion;
    else if (v == "copy") out = Operation::Copy;
    else return false;
    return true;
}

bool parse_bool_value(const std::string& value, bool& out) {
    auto v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") out = true;
    else if (v == "false" || v == "0" || v == "no" || v == "off") out = false;
    else return false;
    return true;
}

bool is_secret_param(const std::string& name) {
    auto n = lower(name);
    return n.find("key") != std::string::npos || n.find("secret") != std::string::npos ||
           n.find("token") != std::string::npos || n.find("credential") != std::string::npos;
}

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    auto has = [&](const char* name) {
        auto it = params.find(name);
        return it != params.end() && !it->second.empty();
    };

    if (type.empty()) return "backend type is required";
    if (type == "s3" || type == "r2") {
        if (!has("access_key") || !has("secret_key"))
            return type + " backend requires credentials (--backend-access-key/--backend-secret-key "
                          "or AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY)";
        if (type == "r2" && !has("account_id"))
            return "r2 backend requires 'account_id' (--backend-account-id)";
    } else if (type == "local") {
        if (!has("root")) return "local backend requires 'root' (--backend-root)";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- CdnProfile ---

std::string CdnProfile::device_string() const {
    std::string s = lower(to_string(device));
    if (device == TargetDevice::Quest || device == TargetDevice::PC) {
        std::replace(s.begin(), s.end(), '_', '-');
    }
    return s;
}

std::string CdnProfile::bucket_name() const {
    std::string env = lower(to_string(environment));
    if (device == TargetDevice::Mobile_Android) {
        return "mobile-android-" + lower(product_name) + "-" + env;
    }
    if (device == TargetDevice::Mobile_iOS) {
        return "mobile-ios-" + lower(product_name) + "-" + env;
    }
    return device_string() + "-" + lower(platform_name) + "-" + lower(product_name) + "-" + env;
}

std::string CdnProfile::remote_path(const std::string& version) const {
    return "ServerData/" + device_string() + "/" + to_string(environment) + "/" + version;
}

// --- DeployConfig ---

std::optional<DeployConfig> DeployConfig::from_args(int argc, char* argv[]) {
    DeployConfig config;

    auto next_arg = [&](int& i, const std::string& name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = normalize_flag(argv[i]);

        if (is_backend_bool_flag(arg)) {
            if (arg == "--backend-path-style") config.backend.params["use_path_style"] = "true";
            else if (arg == "--backend-no-verify-ssl") config.backend.params["verify_ssl"] = "false";
            else config.backend.params["unsigned_payload"] = "true";
            continue;
        }

        if (arg.compare(0, 10, "--backend-") == 0) {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!parse_backend_flag(arg.substr(10), v, config.backend)) {
                std::cerr << "Error: unknown option: " << argv[i - 1] << "\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg.compare(0, 10, "--cdn-url-") == 0) {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            Environment env;
            if (!parse_environment(arg.substr(10), env)) {
                std::cerr << "Error: unknown environment in " << arg << "\n";
                return std::nullopt;
            }
            config.cdn_urls[static_cast<size_t>(env)] = v;
            continue;
        }

        uint64_t n = 0;
        if (arg == "--operation") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!parse_operation(v, config.operation)) {
                std::cerr << "Error: unknown operation: " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--release-version") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.release_version = v;
        } else if (arg == "--target-device") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!parse_target_device(v, config.target_device)) {
                std::cerr << "Error: unknown target device: " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--environment") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!parse_environment(v, config.environment)) {
                std::cerr << "Error: unknown environment: " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--prefix") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.prefix = v;
        } else if (arg == "--cleanup-multipart-uploads") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!parse_bool_value(v, config.cleanup_multipart_uploads)) {
                std::cerr << "Error: " << arg << " expects true or false, got '" << v << "'\n";
                return std::nullopt;
            }
        } else if (arg == "--build-path") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.build_path = v;
        } else if (arg == "--bucket") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.bucket = v;
        } else if (arg == "--source-prefix") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.source_prefix = v;
        } else if (arg == "--target-prefix") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.target_prefix = v;
        } else if (arg == "--platform-name") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.platform_name = v;
        } else if (arg == "--product-name") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.product_name = v;
        } else if (arg == "--upload-concurrency") {
            auto* v = next_arg(i, arg);
            if (!v || !parse_count(arg.c_str(), v, n)) return std::nullopt;
            config.upload_concurrency = static_cast<size_t>(n);
        } else if (arg == "--upload-timeout-minutes") {
            auto* v = next_arg(i, arg);
            if (!v || !parse_count(arg.c_str(), v, n)) return std::nullopt;
            config.upload_timeout_minutes = static_cast<uint32_t>(n);
        } else if (arg == "--batch") {
            config.interactive = false;
        } else if (arg == "--interactive") {
            config.interactive = true;
        } else if (arg == "--request-timeout-minutes") {
            auto* v = next_arg(i, arg);
            if (!v || !parse_count(arg.c_str(), v, n)) return std::nullopt;
            config.request_timeout_minutes = static_cast<uint32_t>(n);
        } else if (arg == "--max-error-retry") {
            auto* v = next_arg(i, arg);
            if (!v || !parse_count(arg.c_str(), v, n)) return std::nullopt;
            config.max_error_retry = static_cast<uint32_t>(n);
        } else if (arg == "--config") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, arg);
            if (!v || !parse_count(arg.c_str(), v, n)) return std::nullopt;
            config.metrics_interval_secs = static_cast<size_t>(n);
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return std::nullopt;
        }
    }

    // Load credentials from environment if not set on CLI
    if (config.backend.type == "s3" || config.backend.type == "r2") {
        auto& params = config.backend.params;
        auto fill = [&](const char* name, const char* env) {
            if (params.count(name) == 0 || params[name].empty()) {
                if (const char* v = std::getenv(env)) params[name] = v;
            }
        };
        fill("access_key", "AWS_ACCESS_KEY_ID");
        fill("secret_key", "AWS_SECRET_ACCESS_KEY");
        fill("session_token", "AWS_SESSION_TOKEN");
    }

    config.apply_defaults();
    return config;
}

bool DeployConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        auto enum_field = [&](const char* name, auto parser, auto& target) -> bool {
            if (!j.contains(name)) return true;
            auto v = j[name].get<std::string>();
            if (!parser(v, target)) {
                std::cerr << "Error: invalid " << name << " in config: " << v << "\n";
                return false;
            }
            return true;
        };
        if (!enum_field("operation", parse_operation, operation)) return false;
        if (!enum_field("target_device", parse_target_device, target_device)) return false;
        if (!enum_field("environment", parse_environment, environment)) return false;

        if (j.contains("release_version")) release_version = j["release_version"].get<std::string>();
        if (j.contains("prefix")) prefix = j["prefix"].get<std::string>();
        if (j.contains("cleanup_multipart_uploads"))
            cleanup_multipart_uploads = j["cleanup_multipart_uploads"].get<bool>();
        if (j.contains("build_path")) build_path = j["build_path"].get<std::string>();
        if (j.contains("bucket")) bucket = j["bucket"].get<std::string>();
        if (j.contains("source_prefix")) source_prefix = j["source_prefix"].get<std::string>();
        if (j.contains("target_prefix")) target_prefix = j["target_prefix"].get<std::string>();
        if (j.contains("platform_name")) platform_name = j["platform_name"].get<std::string>();
        if (j.contains("product_name")) product_name = j["product_name"].get<std::string>();
        if (j.contains("upload_concurrency")) upload_concurrency = j["upload_concurrency"].get<size_t>();
        if (j.contains("upload_timeout_minutes"))
            upload_timeout_minutes = j["upload_timeout_minutes"].get<uint32_t>();
        if (j.contains("interactive")) interactive = j["interactive"].get<bool>();
        if (j.contains("request_timeout_minutes"))
            request_timeout_minutes = j["request_timeout_minutes"].get<uint32_t>();
        if (j.contains("max_error_retry")) max_error_retry = j["max_error_retry"].get<uint32_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("cdn_urls") && j["cdn_urls"].is_object()) {
            for (auto& [name, url] : j["cdn_urls"].items()) {
                Environment env;
                if (!parse_environment(name, env)) {
                    std::cerr << "Error: unknown environment in cdn_urls: " << name << "\n";
                    return false;
                }
                cdn_urls[static_cast<size_t>(env)] = url.get<std::string>();
            }
        }

        // Parse backend
        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = lower(jb["type"].get<std::string>());
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                backend.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void DeployConfig::apply_defaults() {
    if (request_timeout_minutes == 0) {
        request_timeout_minutes = interactive ? constants::INTERACTIVE_REQUEST_TIMEOUT_MINUTES
                                              : constants::BATCH_REQUEST_TIMEOUT_MINUTES;
    }

    auto set_default = [&](const char* name, const std::string& value) {
        if (backend.params.count(name) == 0 || backend.params[name].empty()) {
            backend.params[name] = value;
        }
    };
    if (backend.type == "s3" || backend.type == "r2") {
        set_default("request_timeout_minutes", std::to_string(request_timeout_minutes));
        set_default("max_retries", std::to_string(max_error_retry));
    }
}

std::string DeployConfig::validate() const {
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;

    switch (operation) {
    case Operation::Upload:
        if (release_version.empty()) return "release_version is required for upload (--release-version)";
        if (build_path.empty()) return "build_path is required for upload (--build-path)";
        if (!std::filesystem::is_directory(build_path))
            return "build_path is not a directory: " + build_path.string();
        if (upload_concurrency == 0) return "upload_concurrency must be > 0";
        if (upload_timeout_minutes == 0) return "upload_timeout_minutes must be > 0";
        break;
    case Operation::Copy:
        if (source_prefix.empty() || target_prefix.empty())
            return "copy requires --source-prefix and --target-prefix";
        break;
    default:
        break;
    }

    if (resolved_bucket().empty()) return "bucket name is empty";
    return {};
}

CdnProfile DeployConfig::profile() const {
    CdnProfile p;
    p.device = target_device;
    p.environment = environment;
    p.platform_name = platform_name;
    p.product_name = product_name;
    p.cdn_urls = cdn_urls;
    return p;
}

std::string DeployConfig::resolved_bucket() const {
    return bucket.empty() ? profile().bucket_name() : bucket;
}

}  // namespace assetcdn
