/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "audit/ComplianceAuditor.hpp"
#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "config/ConfigLoader.hpp"
#include "config/InventoryLoader.hpp"
#include "devices/MemoryDevice.hpp"
#include "devices/UtilityFallbackAccessor.hpp"
#include "engine/WipeOrchestrator.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

// Application name
constexpr auto APP_NAME = "disk-sanitizer-cli";

// Initial content of simulated devices, so that a wipe is observable
constexpr uint8_t SIMULATED_FILL = 0xA5;

// Command line options
const struct option long_options[] = {
    {          "help",       no_argument, nullptr, 'h'},
    {       "version",       no_argument, nullptr, 'V'},
    {"list-standards",       no_argument, nullptr, 'L'},
    {          "json",       no_argument, nullptr, 'j'},
    {       "verbose",       no_argument, nullptr, 'v'},
    {     "inventory", required_argument, nullptr, 'i'},
    {          "wipe", required_argument, nullptr, 'w'},
    {      "standard", required_argument, nullptr, 's'},
    {       "confirm", required_argument, nullptr, 'c'},
    {        "config", required_argument, nullptr, 'C'},
    {    "output-dir", required_argument, nullptr, 'o'},
    {      "simulate", required_argument, nullptr, 'S'},
    {         "audit", required_argument, nullptr, 'a'},
    {         nullptr,                 0, nullptr,   0}
};

/**
 * @brief Parse a byte count with an optional binary suffix (K, M, G, T)
 */
auto parse_size(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end == text.data()) {
        return std::nullopt;
    }

    std::string_view suffix(end, static_cast<size_t>(text.data() + text.size() - end));
    uint64_t multiplier = 1;
    if (suffix.empty()) {
        multiplier = 1;
    } else if (suffix.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(suffix.front()))) {
            case 'K':
                multiplier = 1ULL << 10;
                break;
            case 'M':
                multiplier = 1ULL << 20;
                break;
            case 'G':
                multiplier = 1ULL << 30;
                break;
            case 'T':
                multiplier = 1ULL << 40;
                break;
            default:
                return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (value == 0 || value > UINT64_MAX / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "disk-sanitizer" / "logs";
    auto& logger = util::Logger::instance();
    if (!logger.initialize(log_dir, APP_NAME)) {
        std::cerr << "Warning: cannot write logs to " << log_dir << "\n";
    }
    if (options.verbose) {
        logger.set_min_level(util::LogLevel::DEBUG);
        logger.set_console_output(true);
    }

    if (options.invalid) {
        std::cerr << "Run with --help for usage.\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.list_standards) {
        return cmd_list_standards(options.json_output);
    }

    if (!options.audit_path.empty()) {
        return cmd_audit(options);
    }

    if (!options.device_ids.empty()) {
        return cmd_wipe(options);
    }

    // No command specified
    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Full rescan on every call
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVLjvi:w:s:c:C:o:S:a:", long_options, nullptr)) !=
           -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'L':
                options.list_standards = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'i':
                options.inventory_path = optarg;
                break;
            case 'w':
                options.device_ids.emplace_back(optarg);
                break;
            case 's':
                options.standard_id = optarg;
                break;
            case 'c':
                options.confirmation = std::string(optarg);
                break;
            case 'C':
                options.config_path = optarg;
                break;
            case 'o':
                options.output_dir = optarg;
                break;
            case 'S':
                options.simulate_bytes = parse_size(optarg);
                if (!options.simulate_bytes) {
                    std::cerr << "Error: invalid size '" << optarg << "' for --simulate\n";
                    options.invalid = true;
                }
                break;
            case 'a':
                options.audit_path = optarg;
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        options.invalid = true;
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Sanitize storage devices to a named standard and record an audit trail\n\n"
              << "Commands:\n"
              << "  -L, --list-standards       List the sanitization standards\n"
              << "  -w, --wipe <id>            Sanitize the device with this inventory id\n"
              << "                             (repeat for several devices)\n"
              << "  -a, --audit <file>         Re-run the compliance audit of a session record\n\n"
              << "Options:\n"
              << "  -h, --help                 Show this help message\n"
              << "  -V, --version              Show version information\n"
              << "  -j, --json                 JSON output (with --list-standards, --audit)\n"
              << "  -i, --inventory <file>     Device inventory (JSON array)\n"
              << "  -s, --standard <id>        Standard to apply\n"
              << "  -c, --confirm <token>      Confirmation token (prompted if omitted)\n"
              << "  -C, --config <file>        Engine configuration (JSON)\n"
              << "  -o, --output-dir <dir>     Where session records are written (default: .)\n"
              << "  -S, --simulate <bytes>     Use in-memory devices of this size (K/M/G/T)\n"
              << "  -v, --verbose              Mirror the log to stderr at debug level\n\n"
              << "Exit status is 0 only if every session completed and is compliant.\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --list-standards\n"
              << "  " << APP_NAME << " --inventory devices.json --wipe sdb --standard BSI_VS_A\n"
              << "  " << APP_NAME << " --simulate 64M --wipe sim0 --standard NIST_800_88 "
              << "--confirm ERASE\n"
              << "  " << APP_NAME << " --audit session-sdb-1a2b3c4d.json --json\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of disk-sanitizer - auditable storage sanitization\n";
}

auto CliApplication::cmd_list_standards(bool json) -> int {
    auto standards = catalog_.standards();

    if (json) {
        auto list = nlohmann::json::array();
        for (const auto& standard : standards) {
            auto passes = nlohmann::json::array();
            for (const auto& pass : standard.passes) {
                nlohmann::json entry = {{"pattern", to_string(pass.pattern)},
                                        {"verification", to_string(pass.verification)}};
                if (pass.is_deterministic()) {
                    entry["value"] = pass.value;
                }
                if (pass.complement_of) {
                    entry["complement_of"] = *pass.complement_of;
                }
                passes.push_back(std::move(entry));
            }
            list.push_back({{"id", standard.id},
                            {"name", standard.name},
                            {"description", standard.description},
                            {"passes", std::move(passes)}});
        }
        std::cout << list.dump(2) << "\n";
        return 0;
    }

    print_standards_table(standards);
    return 0;
}

auto CliApplication::prepare_devices(const CliOptions& options, const engine::WipeConfig& config,
                                     std::vector<DeviceInfo>& inventory)
    -> std::shared_ptr<devices::IAccessorFactory> {
    if (options.simulate_bytes) {
        auto factory = std::make_shared<devices::MemoryAccessorFactory>();
        for (const auto& id : options.device_ids) {
            if (factory->device(id)) {
                continue;
            }
            DeviceInfo device;
            device.id = id;
            device.path = "memory://" + id;
            device.capacity_bytes = *options.simulate_bytes;
            device.model = "Simulated device";
            inventory.push_back(device);
            factory->add_device(id, std::make_shared<devices::MemoryDevice>(*options.simulate_bytes,
                                                                            SIMULATED_FILL));
        }
        LOG_INFO("CLI", "Simulating " + std::to_string(inventory.size()) + " in-memory devices of " +
                            std::to_string(*options.simulate_bytes) + " bytes");
        return factory;
    }

    if (options.inventory_path.empty()) {
        std::cerr << "Error: --inventory is required (or --simulate for in-memory devices)\n";
        return nullptr;
    }
    auto loaded = config::load_inventory(options.inventory_path);
    if (!loaded) {
        std::cerr << "Error: " << loaded.error().message << "\n";
        return nullptr;
    }
    inventory = std::move(*loaded);
    return std::make_shared<devices::SystemAccessorFactory>(config.fallback_command);
}

auto CliApplication::cmd_wipe(const CliOptions& options) -> int {
    engine::WipeConfig config;
    if (!options.config_path.empty()) {
        auto loaded = config::load_wipe_config(options.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    if (options.standard_id.empty()) {
        std::cerr << "Error: --standard is required. Run with --list-standards to see them.\n";
        return 1;
    }
    auto standard = catalog_.find(options.standard_id);
    if (!standard) {
        LOG_ERROR("CLI", standard.error().message);
        std::cerr << "Error: " << standard.error().message << "\n"
                  << "Run with --list-standards to see available standards.\n";
        return 1;
    }

    std::vector<DeviceInfo> inventory;
    auto factory = prepare_devices(options, config, inventory);
    if (!factory) {
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(options.output_dir, ec);
    if (ec) {
        std::cerr << "Error: cannot create " << options.output_dir << ": " << ec.message() << "\n";
        return 1;
    }

    WipeRequest request;
    request.device_ids = options.device_ids;
    request.standard_id = options.standard_id;
    if (options.confirmation) {
        request.confirmation_token = *options.confirmation;
    } else if (isatty(STDIN_FILENO) != 0) {
        request.confirmation_token =
            prompt_confirmation(options.device_ids, standard->name, config.confirmation_phrase);
    }

    engine::WipeOrchestrator orchestrator(config, std::move(inventory), factory);

    // Set up signal handler for graceful cancellation
    g_cancel_requested.store(false);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::atomic<bool> done{false};
    std::thread watcher([&orchestrator, &done] {
        forward_cancellation(orchestrator, g_cancel_requested, done);
    });

    ProgressDisplay progress(standard->name, standard->passes.size());

    std::vector<std::shared_ptr<const WipeSession>> sessions;
    try {
        sessions = orchestrator.run(request,
                                    [&progress](const ProgressEvent& event) {
                                        progress.update(event);
                                    });
    } catch (const std::exception& e) {
        done.store(true);
        watcher.join();
        LOG_ERROR("CLI", std::string("Run aborted: ") + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    done.store(true);
    watcher.join();

    bool all_compliant = true;
    for (const auto& session : sessions) {
        auto verdict = audit::ComplianceAuditor::audit(*standard, *session);
        const bool ok = session->status == SessionStatus::COMPLETED && verdict.compliant;
        all_compliant = all_compliant && ok;

        LOG_INFO("CLI", "Session " + session->session_id + " on " + session->device.id + ": " +
                            std::string(to_string(session->status)) + ", " +
                            (verdict.compliant ? "compliant" : "not compliant") + " (" +
                            std::to_string(verdict.deviations.size()) + " deviations)");

        auto path = record_path(options.output_dir, *session);
        auto saved = audit::SessionSerializer::save(path, *session, verdict);

        std::string message = session->device.id.empty() ? std::string("(no device)")
                                                         : session->device.id;
        message += ": " + std::string(to_string(session->status)) + ", " +
                   (verdict.compliant ? "compliant" : "NOT compliant") + ", " +
                   ProgressDisplay::format_bytes(session->total_bytes_written()) + " written";
        if (session->failure) {
            message += " - " + session->failure->message;
        }
        if (saved) {
            message += "\n     record: " + path.string();
        } else {
            message += "\n     record not saved: " + saved.error().message;
            all_compliant = false;
        }
        progress.complete(ok, message);

        if (!verdict.compliant) {
            print_verdict(verdict);
        }
    }

    if (g_cancel_requested.load()) {
        std::cout << "Cancelled.\n";
    }
    return all_compliant ? 0 : 1;
}

void CliApplication::forward_cancellation(engine::WipeOrchestrator& orchestrator,
                                          const std::atomic<bool>& requested,
                                          const std::atomic<bool>& done,
                                          std::chrono::milliseconds poll) {
    bool announced = false;
    while (!done.load()) {
        if (requested.load()) {
            if (!announced) {
                std::cerr << "\nCancellation requested..." << std::endl;
                announced = true;
            }
            orchestrator.cancel();
        }
        std::this_thread::sleep_for(poll);
    }
}

auto CliApplication::cmd_audit(const CliOptions& options) -> int {
    auto record = audit::SessionSerializer::load(options.audit_path);
    if (!record) {
        std::cerr << "Error: " << record.error().message << "\n";
        return 1;
    }

    auto verdict = audit::ComplianceAuditor::audit(catalog_, record->session);
    if (!verdict) {
        std::cerr << "Error: " << verdict.error().message << "\n";
        return 1;
    }

    if (record->verdict && *record->verdict != *verdict) {
        LOG_WARNING("CLI", "Stored verdict of session " + record->session.session_id +
                               " differs from the recomputed verdict");
        std::cerr << "Warning: the stored verdict differs from the recomputed one\n";
    }

    if (options.json_output) {
        std::cout << audit::SessionSerializer::verdict_to_json(*verdict).dump(2) << "\n";
    } else {
        std::cout << "Session " << record->session.session_id << " on "
                  << record->session.device.id << " (" << record->session.device.path << ")\n"
                  << "Status: " << to_string(record->session.status)
                  << ", access: " << to_string(record->session.access_mode) << "\n";
        print_verdict(*verdict);
    }
    return verdict->compliant ? 0 : 1;
}

auto CliApplication::prompt_confirmation(const std::vector<std::string>& device_ids,
                                         const std::string& standard, const std::string& phrase)
    -> std::string {
    std::cout << "\n";
    std::cout << "\033[1;31mWARNING: This will PERMANENTLY DESTROY all data on:";
    for (const auto& id : device_ids) {
        std::cout << " " << id;
    }
    std::cout << "\033[0m\n";
    std::cout << "Standard: " << standard << "\n\n";
    std::cout << "Type '" << phrase << "' to confirm: ";
    std::cout.flush();

    std::string input;
    std::getline(std::cin, input);
    return input;
}

void CliApplication::print_standards_table(const std::vector<Standard>& standards) {
    // Column widths for table formatting
    constexpr int COL_ID = 20;
    constexpr int COL_PASSES = 8;
    constexpr int COL_VERIFY = 12;

    std::cout << std::left << std::setw(COL_ID) << "ID" << std::setw(COL_PASSES) << "PASSES"
              << std::setw(COL_VERIFY) << "VERIFY" << "NAME\n";
    std::cout << std::string(COL_ID + COL_PASSES + COL_VERIFY + 30, '-') << "\n";

    for (const auto& standard : standards) {
        std::string verify = "none";
        for (const auto& pass : standard.passes) {
            if (pass.verification != VerificationMode::NONE) {
                verify = std::string(to_string(pass.verification));
            }
        }
        std::cout << std::left << std::setw(COL_ID) << standard.id << std::setw(COL_PASSES)
                  << standard.passes.size() << std::setw(COL_VERIFY) << verify << standard.name
                  << "\n";
    }
}

void CliApplication::print_verdict(const AuditVerdict& verdict) {
    std::cout << "Audit against " << verdict.standard_id << ": "
              << (verdict.compliant ? "COMPLIANT" : "NOT COMPLIANT") << "\n";
    for (const auto& deviation : verdict.deviations) {
        std::cout << "  [" << to_string(deviation.severity) << "] " << to_string(deviation.kind);
        if (deviation.pass_index) {
            std::cout << " (pass " << (*deviation.pass_index + 1) << ")";
        }
        std::cout << ": " << deviation.description << "\n";
    }
}

auto CliApplication::record_path(const std::filesystem::path& dir, const WipeSession& session)
    -> std::filesystem::path {
    std::string device = session.device.id.empty() ? std::string("none") : session.device.id;
    std::replace_if(
        device.begin(), device.end(),
        [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '-' && c != '_' &&
                   c != '.';
        },
        '_');
    return dir / ("session-" + device + "-" + session.session_id.substr(0, 8) + ".json");
}

}  // namespace cli
