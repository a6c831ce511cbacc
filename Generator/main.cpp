#include "../shared-libs/ConfigManager.hpp"
#include "../shared-libs/Generator.hpp"
#include "../shared-libs/Errors.hpp"
#include "libs/CommandManager.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Percorso del file di configurazione
const std::string defaultConfigPath = "config.json";
const std::vector<std::string> configKeys = {"configVersion", "outputCase", "nodeSource", "nodeAddress", "orgId", "defaultNamespace", "verbose"};

// Sceglie da dove leggere il campo node delle versioni 1 e 2
std::unique_ptr<unik::NodeProvider> makeNodeProvider(const ConfigManager& configManager, unik::EntropySource& entropy) {
    const std::string nodeSource = configManager.getString("nodeSource");
    if (nodeSource == "mac") {
        return std::unique_ptr<unik::NodeProvider>(new unik::SystemNodeProvider());
    } else if (nodeSource == "random") {
        return std::unique_ptr<unik::NodeProvider>(new unik::RandomNodeProvider(entropy));
    } else if (nodeSource == "fixed") {
        return std::unique_ptr<unik::NodeProvider>(new unik::FixedNodeProvider(unik::Node::fromString(configManager.getString("nodeAddress"))));
    }
    throw std::runtime_error("Il parametro di configurazione 'nodeSource' deve essere mac, random oppure fixed.");
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath = defaultConfigPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    try {
        ConfigManager configManager(configPath, configKeys);

        CommandOptions options;
        const std::string outputCase = configManager.getString("outputCase");
        if (outputCase == "upper") {
            options.mCase = unik::Case::UPPER;
        } else if (outputCase != "lower") {
            throw std::runtime_error("Il parametro di configurazione 'outputCase' deve essere lower oppure upper.");
        }
        options.mDefaultNamespace = resolveNamespace(configManager.getString("defaultNamespace"));

        if (configManager.getBool("verbose")) {
            std::cerr << "FILE DI CONFIGURAZIONE (v." << configManager.getString("configVersion") << ") CARICATO: " << std::endl;
            std::cerr << "> Formato: " << outputCase << std::endl;
            std::cerr << "> Sorgente node: " << configManager.getString("nodeSource") << std::endl;
            std::cerr << "> Namespace di default: " << options.mDefaultNamespace << std::endl;
            std::cerr << std::endl;
        }

        unik::OpenSSLEntropySource entropy;
        unik::ClockSequence clockSequence(entropy);
        unik::SystemTimeSource timeSource;
        unik::SystemIdentityProvider identityProvider;
        std::unique_ptr<unik::NodeProvider> nodeProvider = makeNodeProvider(configManager, entropy);

        unik::UUIDGenerator generator(clockSequence, timeSource, *nodeProvider, identityProvider, entropy);
        if (configManager.hasKey("orgId")) {
            generator.setOrgId(parseId(configManager.getString("orgId"), "orgId"));
        }

        return runCommand(args, generator, options, std::cout);
    } catch (const unik::ParseError& e) {
        std::cerr << "[!] UUID non valido: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << std::endl;
        return 1;
    }
}
