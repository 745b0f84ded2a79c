#include "../include/guardian/backend/generator.hpp"
#include "../include/guardian/config.hpp"
#include "../include/guardian/errors.hpp"
#include "../include/guardian/gateway.hpp"
#include "../include/guardian/ledger.hpp"
#include "../include/guardian/log.hpp"
#include "../include/guardian/policy_engine.hpp"
#include "../include/guardian/serve.hpp"

#include <filesystem>
#include <iostream>

int main() {
    using namespace guardian;

    GuardianConfig config;
    try {
        const std::filesystem::path config_path = config_path_from_environment();
        if (std::filesystem::exists(config_path)) {
            config = load_config(config_path);
            log("Guardian", "Loaded configuration from " + config_path.string());
        } else {
            config.policy = default_policy_config();
            log("Guardian", "No configuration at " + config_path.string() + "; using built-in rules");
        }
        apply_environment_overrides(config);
    } catch (const ConfigError& ex) {
        log("Guardian", std::string("Configuration error: ") + ex.what());
        return 2;
    }

    try {
        const PolicyEngine engine(config.policy);
        Ledger ledger(config.ledger.evidence_dir);
        const backend::GeneratorPtr generator = backend::make_generator(config.backend);

        GatewayOptions options;
        options.timeout_ms = config.backend.timeout_ms;
        options.max_attempts = config.backend.max_attempts;
        options.bundle_every = config.ledger.bundle_every;
        Gateway gateway(engine, ledger, generator.get(), options);

        log("Guardian", std::to_string(engine.rule_count()) + " rule(s), default jurisdiction " +
                            engine.config().default_jurisdiction + ", backend " + generator->describe() +
                            ", ledger " + ledger.root().string() + " (" + std::to_string(ledger.size()) +
                            " record(s))");

        Service service(gateway);
        service.run(std::cin, std::cout);
    } catch (const ConfigError& ex) {
        log("Guardian", std::string("Configuration error: ") + ex.what());
        return 2;
    } catch (const IntegrityError& ex) {
        log("Guardian", std::string("Integrity failure, stopping: ") + ex.what());
        return 3;
    } catch (const std::exception& ex) {
        log("Guardian", std::string("Fatal: ") + ex.what());
        return 1;
    }
    return 0;
}
