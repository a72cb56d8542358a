#include "runner_utils.h"

#include "toolgate/config.h"
#include "toolgate/errors.h"
#include "toolgate/shutdown.h"

#include <iostream>

namespace toolgate {

void prepare_runtime() {
    Profile profile = detect_profile();
    apply_profile_defaults(profile);
    if (load_runtime_options().install_shutdown_hook) ShutdownCoordinator::install();
    std::cerr << "[setup] profile=" << profile_name(profile) << "\n";
}

std::optional<ServerConfigSet> load_config_or_report(const std::string& path) {
    try {
        return load_config_file(path);
    } catch (const ConfigError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return std::nullopt;
    }
}

int report_failure(const std::exception& e) {
    if (auto* ce = dynamic_cast<const ConnectionError*>(&e)) {
        std::cerr << "[error] " << connection_error_kind_name(ce->kind()) << ": " << ce->what() << "\n";
        if (ce->cause()) {
            try {
                ce->rethrow_cause();
            } catch (const std::exception& cause) {
                std::cerr << "  caused by: " << cause.what() << "\n";
            }
        }
        return 1;
    }
    if (auto* ve = dynamic_cast<const ValidationError*>(&e)) {
        std::cerr << "[error] invalid " << ve->field() << ": " << ve->what() << "\n";
        return 1;
    }
    if (auto* ne = dynamic_cast<const NotFoundError*>(&e)) {
        std::cerr << "[error] executable not found (" << ne->command() << "): " << ne->what() << "\n";
        return 1;
    }
    std::cerr << "[error] " << e.what() << "\n";
    return 1;
}

std::optional<json::Value> parse_args_object(const std::string& text) {
    if (text.empty()) return json::Value::object();
    json::Value v = json::Value::parse(text);
    if (!v.is_object()) return std::nullopt;
    return v;
}

} // namespace toolgate
