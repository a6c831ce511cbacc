#include "CommandManager.hpp"
#include "../../shared-libs/Layout.hpp"
#include "../../shared-libs/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <limits>
#include <stdexcept>

using namespace unik;

// Funzione per ottenere il comando dal testo inserito
Command getCommand(const std::string& command) {
    static const std::map<std::string, Command> commandMap = {
        {"v1", CMD_V1},
        {"v2", CMD_V2},
        {"v3", CMD_V3},
        {"v4", CMD_V4},
        {"v5", CMD_V5},
        {"parse", CMD_PARSE},
        {"bench", CMD_BENCH},
        {"help", CMD_HELP}
    };

    auto it = commandMap.find(command);
    if (it != commandMap.end()) {
        return it->second;
    } else {
        return CMD_UNKNOWN;
    }
}

UUID resolveNamespace(const std::string& name) {
    if (name == "dns") return UUID::NAMESPACE_DNS;
    if (name == "url") return UUID::NAMESPACE_URL;
    if (name == "oid") return UUID::NAMESPACE_OID;
    if (name == "x500") return UUID::NAMESPACE_X500;
    return UUID::parse(name);
}

Domain resolveDomain(const std::string& name) {
    if (name == "person") return Domain::PERSON;
    if (name == "group") return Domain::GROUP;
    if (name == "org") return Domain::ORG;
    throw std::invalid_argument("Dominio '" + name + "' sconosciuto: usa person, group oppure org.");
}

std::uint64_t parseUnsigned(const std::string& text, std::uint64_t maximum, const std::string& what) {
    // stoull accetta anche spazi e segno meno, qui sono ammesse solo cifre
    const bool digitsOnly = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
    if (!digitsOnly) {
        throw std::invalid_argument("Il valore di " + what + " deve essere un intero non negativo, trovato '" + text + "'.");
    }

    const std::string tooLarge = "Il valore di " + what + " non può superare " + std::to_string(maximum) + ", trovato " + text + ".";
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::out_of_range(tooLarge);
    }
    if (value > maximum) {
        throw std::out_of_range(tooLarge);
    }
    return value;
}

std::uint32_t parseId(const std::string& text, const std::string& what) {
    return static_cast<std::uint32_t>(parseUnsigned(text, std::numeric_limits<std::uint32_t>::max(), what));
}

// numero di UUID da generare, 1 se non indicato
static unsigned long parseCount(const std::vector<std::string>& args, std::size_t index) {
    if (args.size() <= index) return 1;
    const std::uint64_t count = parseUnsigned(args[index], std::numeric_limits<unsigned long>::max(), "n");
    if (count == 0) throw std::invalid_argument("Il numero di UUID da generare deve essere maggiore di 0.");
    return static_cast<unsigned long>(count);
}

void printLayout(std::ostream& os, const UUID& uuid) {
    const Layout layout = Layout::unpack(uuid);
    const Variant variant = layout.getVariant();

    os << "> UUID: " << uuid << std::endl;
    os << "> Variante: " << variantToString(variant) << std::endl;

    if (variant != Variant::RFC4122) {
        return; // la versione ha senso solo per la variante RFC 4122
    }

    Version version;
    try {
        version = layout.getVersion();
    } catch (const DecodeError& e) {
        os << "> Versione: non riconosciuta (" << e.what() << ")" << std::endl;
        return;
    }

    os << "> Versione: " << versionToString(version) << std::endl;
    os << std::hex << std::setfill('0');
    os << "> time_low: 0x" << std::setw(8) << layout.mTimeLow << std::endl;
    os << "> time_mid: 0x" << std::setw(4) << layout.mTimeMid << std::endl;
    os << "> time_hi_and_version: 0x" << std::setw(4) << layout.mTimeHiAndVersion << std::endl;
    os << "> clock_seq: 0x" << std::setw(4) << layout.mClockSeq << std::endl;
    os << std::dec << std::setfill(' ');
    os << "> node: " << layout.mNode << std::endl;

    if (version == Version::TIME) {
        os << "> Timestamp (100ns dal 1582-10-15): " << layout.getTimestamp() << std::endl;
        os << "> Sequenza di clock: " << layout.getClockSequence() << std::endl;
    } else if (version == Version::DCE) {
        os << "> Id: " << layout.mTimeLow << std::endl;
        try {
            os << "> Dominio: " << domainToString(layout.getDomain()) << std::endl;
        } catch (const DecodeError& e) {
            os << "> Dominio: non riconosciuto (" << e.what() << ")" << std::endl;
        }
    }
}

// Misura il tempo medio di generazione, sostituisce i benchmark della libreria
static void runBenchmark(std::ostream& os, UUIDGenerator& generator, unsigned long iterations) {
    const Timestamp timestamp = 0x1DD7A8F2C4B0000ULL;
    const Node node = Node::fromString("ffffffffffff");
    const std::vector<std::pair<std::string, std::function<UUID()>>> cases = {
        {"v1", [&generator, timestamp, node]() { return generator.v1(timestamp, node); }},
        {"v2", [&generator, timestamp, node]() { return generator.v2(timestamp, node, Domain::PERSON, 1000); }},
        {"v3", []() { return UUIDGenerator::v3(UUID::NAMESPACE_DNS, "test"); }},
        {"v4", [&generator]() { return generator.v4(); }},
        {"v5", []() { return UUIDGenerator::v5(UUID::NAMESPACE_X500, "test"); }}
    };

    for (const auto& benchCase : cases) {
        const auto start = std::chrono::steady_clock::now();
        UUID last;
        for (unsigned long i = 0; i < iterations; ++i) {
            last = benchCase.second();
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count();
        os << "> " << benchCase.first << ": " << (elapsed / static_cast<long long>(iterations)) << " ns/uuid (ultimo " << last << ")" << std::endl;
    }
}

void printHelp(std::ostream& os) {
    os << "Uso: unik [--config percorso] <comando> [argomenti]" << std::endl;
    os << "  v1 [n]                        UUID basati sul tempo" << std::endl;
    os << "  v2 person|group|org [id]      UUID DCE security" << std::endl;
    os << "  v3 <nome> [namespace]         UUID basato su nome (SHA-1)" << std::endl;
    os << "  v4 [n]                        UUID casuali" << std::endl;
    os << "  v5 <nome> [namespace]         UUID basato su nome (MD5)" << std::endl;
    os << "  parse <uuid>                  mostra versione, variante e campi" << std::endl;
    os << "  bench [iterazioni]            misura il tempo di generazione" << std::endl;
    os << "  help                          mostra questo messaggio" << std::endl;
    os << "namespace: dns, url, oid, x500 oppure un UUID" << std::endl;
}

int runCommand(const std::vector<std::string>& args, UUIDGenerator& generator, const CommandOptions& options, std::ostream& os) {
    if (args.empty()) {
        printHelp(os);
        return 1;
    }

    switch (getCommand(args[0])) {
        case CMD_V1: {
            const unsigned long count = parseCount(args, 1);
            for (unsigned long i = 0; i < count; ++i) {
                os << generator.v1().toString(options.mCase) << std::endl;
            }
        }
        break;
        case CMD_V2: {
            if (args.size() < 2) throw std::invalid_argument("Il comando v2 richiede il dominio (person, group, org).");
            const Domain domain = resolveDomain(args[1]);
            const UUID uuid = args.size() > 2
                ? generator.v2(domain, parseId(args[2], "id"))
                : generator.v2(domain);
            os << uuid.toString(options.mCase) << std::endl;
        }
        break;
        case CMD_V3:
        case CMD_V5: {
            if (args.size() < 2) throw std::invalid_argument("Il comando " + args[0] + " richiede il nome.");
            const UUID ns = args.size() > 2 ? resolveNamespace(args[2]) : options.mDefaultNamespace;
            const UUID uuid = getCommand(args[0]) == CMD_V3 ? UUIDGenerator::v3(ns, args[1]) : UUIDGenerator::v5(ns, args[1]);
            os << uuid.toString(options.mCase) << std::endl;
        }
        break;
        case CMD_V4: {
            const unsigned long count = parseCount(args, 1);
            for (unsigned long i = 0; i < count; ++i) {
                os << generator.v4().toString(options.mCase) << std::endl;
            }
        }
        break;
        case CMD_PARSE: {
            if (args.size() < 2) throw std::invalid_argument("Il comando parse richiede un UUID.");
            printLayout(os, UUID::parse(args[1]));
        }
        break;
        case CMD_BENCH: {
            runBenchmark(os, generator, args.size() > 1 ? parseCount(args, 1) : 100000);
        }
        break;
        case CMD_HELP: {
            printHelp(os);
        }
        break;
        default: {
            std::cerr << "[!] Comando '" << args[0] << "' sconosciuto." << std::endl;
            printHelp(os);
            return 1;
        }
    }

    return 0;
}
