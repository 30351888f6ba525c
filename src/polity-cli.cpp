// POLITY CLI - Command Line Interface
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// The polity-cli tool opens a node's data directory and runs a single
// governance command against it through LocalGovernanceService.

#include <polity/core/hex.h>
#include <polity/crypto/keys.h>
#include <polity/node/context.h>
#include <polity/service/service.h>
#include <polity/util/config.h>
#include <polity/util/logging.h>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace polity {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "POLITY CLI";

using Args = std::vector<std::string>;

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: polity-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -inmemory                  Use a throwaway in-memory database\n";
    std::cout << "  -dependency.maxdepth=N     Maximum delegation hops (default: 16)\n";
    std::cout << "  -log.level=LEVEL           trace, debug, info, warn, error, off\n";
    std::cout << "  -log.file=FILE             Append log output to FILE\n";
    std::cout << "  -log.console               Log to stderr\n";
    std::cout << "\nCommands:\n";
    std::cout << "  keygen\n";
    std::cout << "  register <pao|sao> <config> [parent] [label]\n";
    std::cout << "  lookup <org>\n";
    std::cout << "  dependents <org>\n";
    std::cout << "  freeze <org> | unfreeze <org> | remove <org>\n";
    std::cout << "  data-put <org> <key> <hex> | data-get <org> <key>\n";
    std::cout << "  begin <org> <config> <privkeys|-> [nonce]\n";
    std::cout << "  commit <transition> | abort <transition> <reason> | transition <transition>\n";
    std::cout << "  migration-id <org> <config> [nonce]\n";
    std::cout << "  submit <org> <name> <payload-hex|-> <privkeys|-> [nonce]\n";
    std::cout << "  status <action> | action <action>\n";
    std::cout << "  vote <action> <yes|no> <privkey>\n";
    std::cout << "  finalize <action> | cancel <action> <privkeys>\n";
    std::cout << "  invite-create <org> <valid-seconds>\n";
    std::cout << "  invite-use <org> <invite> <pubkey> <name> <region> <age> <other>\n";
    std::cout << "  citizen <org> <pubkey> | citizens <org>\n";
    std::cout << "\nGovernance configs:\n";
    std::cout << "  direct:<pubkey>\n";
    std::cout << "  threshold:<threshold>:<window-secs>:<pubkey>=<weight>[,...]\n";
    std::cout << "  delegated\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 POLITY Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

void RequireArgs(const Args& args, size_t count, const std::string& usage) {
    if (args.size() < count) {
        throw std::runtime_error("usage: " + usage);
    }
}

uint64_t ParseNumber(const std::string& str, const char* what) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + str + "'");
    }
    try {
        return std::stoull(str);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string(what) + " out of range");
    }
}

Hash256 ParseHash(const std::string& str, const char* what) {
    try {
        return Hash256::FromHex(str);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(std::string("invalid ") + what + " '" + str + "'");
    }
}

org::GovernanceConfig ParseConfig(const std::string& str) {
    std::string error;
    auto config = org::ParseGovernanceConfig(str, &error);
    if (!config) {
        throw std::runtime_error(error);
    }
    return *config;
}

/// Comma-separated private keys; "-" for none
std::vector<PrivateKey> ParseKeys(const std::string& str) {
    std::vector<PrivateKey> keys;
    if (str == "-") {
        return keys;
    }
    std::istringstream stream(str);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto key = PrivateKey::FromHex(item);
        if (!key) {
            throw std::runtime_error("invalid private key");
        }
        keys.push_back(*key);
    }
    return keys;
}

PublicKey ParsePublicKey(const std::string& str) {
    auto key = PublicKey::FromHex(str);
    if (!key) {
        throw std::runtime_error("invalid public key '" + str + "'");
    }
    return *key;
}

std::vector<uint8_t> ParsePayload(const std::string& str) {
    if (str == "-") {
        return {};
    }
    try {
        return HexToBytes(str);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("invalid payload: ") + e.what());
    }
}

uint8_t ParseSmall(const std::string& str, const char* what) {
    uint64_t value = ParseNumber(str, what);
    if (value > 255) {
        throw std::runtime_error(std::string(what) + " out of range");
    }
    return static_cast<uint8_t>(value);
}

// ============================================================================
// Output
// ============================================================================

int Report(const Status& s) {
    if (!s.ok()) {
        std::cerr << "error: " << s.ToString() << "\n";
        return 1;
    }
    return 0;
}

void PrintRecord(const org::OrganizationRecord& record) {
    std::cout << "id:         " << record.id << "\n";
    std::cout << "kind:       " << org::OrgKindToString(record.kind) << "\n";
    if (record.parent) {
        std::cout << "parent:     " << *record.parent << "\n";
    }
    if (!record.label.empty()) {
        std::cout << "label:      " << record.label << "\n";
    }
    std::cout << "status:     " << org::OrgStatusToString(record.status) << "\n";
    std::cout << "version:    " << record.version << "\n";
    std::cout << "governance: " << record.governance.ToString() << "\n";
    std::cout << "module-ref: " << record.GetGovernanceModuleRef().ToHex() << "\n";
    std::cout << "data:       " << record.data.size() << " entries\n";
}

void PrintTransition(const transition::TransitionRecord& record) {
    std::cout << "transition: " << record.id.ToHex() << "\n";
    std::cout << "org:        " << record.orgId << "\n";
    std::cout << "state:      " << transition::TransitionStateToString(record.state) << "\n";
    std::cout << "from:       " << record.fromConfig.ToString() << "\n";
    std::cout << "to:         " << record.newConfig.ToString() << "\n";
    std::cout << "base:       " << record.baseVersion << "\n";
    if (!record.reason.empty()) {
        std::cout << "reason:     " << record.reason << "\n";
    }
}

// ============================================================================
// Commands
// ============================================================================

using CommandFn = std::function<int(NodeContext&, service::GovernanceService&, const Args&)>;

transition::TransitionHandle LoadHandle(NodeContext& node, const std::string& str) {
    transition::TransitionRecord record;
    Status s = node.engine->GetTransition(ParseHash(str, "transition id"), &record);
    if (!s.ok()) {
        throw std::runtime_error(s.ToString());
    }
    return {record.id, record.orgId, record.state};
}

std::map<std::string, CommandFn> BuildCommands() {
    std::map<std::string, CommandFn> commands;

    commands["register"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 2, "register <pao|sao> <config> [parent] [label]");
        auto kind = org::ParseOrgKind(args[0]);
        if (!kind) {
            throw std::runtime_error("kind must be pao or sao");
        }
        std::optional<org::OrganizationId> parent;
        if (args.size() > 2 && args[2] != "-") {
            parent = ParseNumber(args[2], "parent id");
        }
        std::string label = args.size() > 3 ? args[3] : "";
        org::OrganizationId id = org::NULL_ORG_ID;
        Status s = svc.Register(*kind, parent, ParseConfig(args[1]), &id, label);
        if (s.ok()) {
            std::cout << id << "\n";
        }
        return Report(s);
    };

    commands["lookup"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 1, "lookup <org>");
        org::OrganizationRecord record;
        Status s = svc.Lookup(ParseNumber(args[0], "organization id"), &record);
        if (s.ok()) {
            PrintRecord(record);
        }
        return Report(s);
    };

    commands["dependents"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 1, "dependents <org>");
        std::set<org::OrganizationId> ids;
        Status s = svc.ListDependents(ParseNumber(args[0], "organization id"), &ids);
        for (org::OrganizationId id : ids) {
            std::cout << id << "\n";
        }
        return Report(s);
    };

    commands["freeze"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "freeze <org>");
        return Report(node.registry->Freeze(ParseNumber(args[0], "organization id")));
    };

    commands["unfreeze"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "unfreeze <org>");
        return Report(node.registry->Unfreeze(ParseNumber(args[0], "organization id")));
    };

    commands["remove"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "remove <org>");
        return Report(node.registry->Remove(ParseNumber(args[0], "organization id")));
    };

    commands["data-put"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 3, "data-put <org> <key> <hex>");
        return Report(node.registry->PutData(ParseNumber(args[0], "organization id"), args[1],
                                             ParsePayload(args[2])));
    };

    commands["data-get"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 2, "data-get <org> <key>");
        std::vector<uint8_t> value;
        Status s = node.registry->GetData(ParseNumber(args[0], "organization id"), args[1], &value);
        if (s.ok()) {
            std::cout << BytesToHex(value) << "\n";
        }
        return Report(s);
    };

    commands["migration-id"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 2, "migration-id <org> <config> [nonce]");
        org::OrganizationId id = ParseNumber(args[0], "organization id");
        uint64_t nonce = args.size() > 2 ? ParseNumber(args[2], "nonce") : 0;
        org::OrganizationRecord record;
        Status s = svc.Lookup(id, &record);
        if (s.ok()) {
            governance::Action action = transition::TransitionEngine::MakeMigrationAction(
                id, ParseConfig(args[1]), record.version, nonce);
            std::cout << action.GetHash().ToHex() << "\n";
        }
        return Report(s);
    };

    commands["begin"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 3, "begin <org> <config> <privkeys|-> [nonce]");
        org::OrganizationId id = ParseNumber(args[0], "organization id");
        org::GovernanceConfig config = ParseConfig(args[1]);
        uint64_t nonce = args.size() > 3 ? ParseNumber(args[3], "nonce") : 0;
        org::OrganizationRecord record;
        Status s = svc.Lookup(id, &record);
        if (!s.ok()) {
            return Report(s);
        }
        governance::Action action =
            transition::TransitionEngine::MakeMigrationAction(id, config, record.version, nonce);
        governance::Proof proof = governance::Proof::Sign(action.GetHash(), ParseKeys(args[2]));

        transition::TransitionHandle handle;
        s = svc.BeginTransition(id, config, proof, &handle, nonce);
        if (s.ok()) {
            std::cout << handle.id.ToHex() << " "
                      << transition::TransitionStateToString(handle.state) << "\n";
        }
        return Report(s);
    };

    commands["commit"] = [](NodeContext& node, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 1, "commit <transition>");
        return Report(svc.CommitTransition(LoadHandle(node, args[0])));
    };

    commands["abort"] = [](NodeContext& node, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 2, "abort <transition> <reason>");
        return Report(svc.AbortTransition(LoadHandle(node, args[0]), args[1]));
    };

    commands["transition"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "transition <transition>");
        transition::TransitionRecord record;
        Status s = node.engine->GetTransition(ParseHash(args[0], "transition id"), &record);
        if (s.ok()) {
            PrintTransition(record);
        }
        return Report(s);
    };

    commands["submit"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 4, "submit <org> <name> <payload-hex|-> <privkeys|-> [nonce]");
        org::OrganizationId id = ParseNumber(args[0], "organization id");
        uint64_t nonce = args.size() > 4 ? ParseNumber(args[4], "nonce") : 0;
        governance::Action action = governance::Action::Custom(id, args[1], ParsePayload(args[2]), nonce);
        governance::Proof proof = governance::Proof::Sign(action.GetHash(), ParseKeys(args[3]));

        governance::ActionId actionId;
        Status s = svc.SubmitAction(id, action, proof, &actionId);
        if (s.ok()) {
            authz::ActionState state = authz::ActionState::Submitted;
            s = svc.ActionStatus(actionId, &state);
            std::cout << actionId.ToHex() << " " << authz::ActionStateToString(state) << "\n";
        }
        return Report(s);
    };

    commands["status"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 1, "status <action>");
        authz::ActionState state = authz::ActionState::Submitted;
        Status s = svc.ActionStatus(ParseHash(args[0], "action id"), &state);
        if (s.ok()) {
            std::cout << authz::ActionStateToString(state) << "\n";
        }
        return Report(s);
    };

    commands["action"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "action <action>");
        authz::ActionRecord record;
        Status s = node.tracker->Get(ParseHash(args[0], "action id"), &record);
        if (s.ok()) {
            std::cout << record.ToString() << "\n";
            std::cout << record.action.ToString() << "\n";
        }
        return Report(s);
    };

    commands["vote"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 3, "vote <action> <yes|no> <privkey>");
        governance::VoteChoice choice;
        if (args[1] == "yes") {
            choice = governance::VoteChoice::Yes;
        } else if (args[1] == "no") {
            choice = governance::VoteChoice::No;
        } else {
            throw std::runtime_error("vote must be yes or no");
        }
        std::vector<PrivateKey> keys = ParseKeys(args[2]);
        if (keys.size() != 1) {
            throw std::runtime_error("vote takes exactly one private key");
        }
        governance::Vote vote = governance::Vote::Create(ParseHash(args[0], "action id"),
                                                         keys.front(), choice);
        authz::ActionState state = authz::ActionState::Pending;
        Status s = svc.CastVote(vote, &state);
        if (s.ok()) {
            std::cout << authz::ActionStateToString(state) << "\n";
        }
        return Report(s);
    };

    commands["finalize"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 1, "finalize <action>");
        authz::ActionState state = authz::ActionState::Pending;
        Status s = svc.FinalizeAction(ParseHash(args[0], "action id"), &state);
        if (s.ok()) {
            std::cout << authz::ActionStateToString(state) << "\n";
        }
        return Report(s);
    };

    commands["cancel"] = [](NodeContext&, service::GovernanceService& svc, const Args& args) {
        RequireArgs(args, 2, "cancel <action> <privkeys>");
        governance::ActionId id = ParseHash(args[0], "action id");
        governance::Proof proof = governance::Proof::Sign(governance::GetCancelHash(id),
                                                          ParseKeys(args[1]));
        return Report(svc.CancelAction(id, proof));
    };

    commands["invite-create"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 2, "invite-create <org> <valid-seconds>");
        Timestamp expiresAt = GetTime() + static_cast<Timestamp>(ParseNumber(args[1], "validity"));
        membership::InviteId id;
        Status s = node.membership->CreateInvite(ParseNumber(args[0], "organization id"),
                                                 expiresAt, &id);
        if (s.ok()) {
            std::cout << id.ToHex() << "\n";
        }
        return Report(s);
    };

    commands["invite-use"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 7, "invite-use <org> <invite> <pubkey> <name> <region> <age> <other>");
        membership::CitizenApplication application;
        application.member = ParsePublicKey(args[2]);
        application.name = args[3];
        application.region = ParseSmall(args[4], "region");
        application.ageGroup = ParseSmall(args[5], "age group");
        application.otherDemographic = ParseSmall(args[6], "demographic");

        membership::Citizen citizen;
        Status s = node.membership->UseInvite(ParseNumber(args[0], "organization id"),
                                              ParseHash(args[1], "invite id"),
                                              application, &citizen);
        if (s.ok()) {
            std::cout << citizen.ToString() << "\n";
        }
        return Report(s);
    };

    commands["citizen"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 2, "citizen <org> <pubkey>");
        membership::Citizen citizen;
        Status s = node.membership->GetCitizen(ParseNumber(args[0], "organization id"),
                                               ParsePublicKey(args[1]), &citizen);
        if (s.ok()) {
            std::cout << citizen.ToString() << "\n";
        }
        return Report(s);
    };

    commands["citizens"] = [](NodeContext& node, service::GovernanceService&, const Args& args) {
        RequireArgs(args, 1, "citizens <org>");
        uint64_t count = 0;
        Status s = node.membership->CitizenCount(ParseNumber(args[0], "organization id"), &count);
        if (s.ok()) {
            std::cout << count << "\n";
        }
        return Report(s);
    };

    return commands;
}

// ============================================================================
// Main Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> positional;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv, &positional);
    if (!parsed.success) {
        std::cerr << "Error parsing command line: " << parsed.ToString() << "\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }
    if (positional.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'polity-cli -help' for usage information.\n";
        return 1;
    }

    const std::string command = positional.front();
    const Args args(positional.begin() + 1, positional.end());

    if (command == "help") {
        PrintHelp();
        return 0;
    }
    if (command == "keygen") {
        PrivateKey key = PrivateKey::Generate();
        std::cout << "private: " << key.ToHex() << "\n";
        std::cout << "public:  " << key.GetPublicKey().ToHex() << "\n";
        return 0;
    }

    auto commands = BuildCommands();
    auto it = commands.find(command);
    if (it == commands.end()) {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        return 1;
    }

    // Config file: explicit -conf must exist; the default one is optional
    std::string dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                         util::ConfigManager::GetDefaultDataDir());
    if (config.HasKey(util::ConfigKeys::CONF)) {
        util::ConfigParseResult fileResult = config.ParseFile(config.GetPath(util::ConfigKeys::CONF));
        if (!fileResult.success) {
            std::cerr << "Error reading config: " << fileResult.ToString() << "\n";
            return 1;
        }
    } else {
        std::filesystem::path defaultConf =
            std::filesystem::path(dataDir) / util::DEFAULT_CONFIG_FILENAME;
        std::error_code ec;
        if (std::filesystem::exists(defaultConf, ec)) {
            util::ConfigParseResult fileResult = config.ParseFile(defaultConf.string());
            if (!fileResult.success) {
                std::cerr << "Error reading config: " << fileResult.ToString() << "\n";
                return 1;
            }
        }
    }
    config.SetDefault(util::ConfigKeys::LOG_CONSOLE, "0");
    config.SetDefault(util::ConfigKeys::LOG_LEVEL, "warn");

    NodeContext node;
    if (!InitializeNode(node, NodeInitOptions::FromConfig(config))) {
        std::cerr << "Error: failed to open node state (see log output)\n";
        return 1;
    }

    service::LocalGovernanceService svc(node);
    int result = it->second(node, svc, args);
    ShutdownNode(node);
    return result;
}

} // namespace cli
} // namespace polity

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return polity::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
