/// @file main.cpp
/// @brief Spell engine sandbox entry point.
///
/// Loads the engine configuration and the spell, class and creature
/// catalogs, places two players and a few creatures in one room, then
/// reads commands from stdin:
///
///   cast <spell> [target]   spellbook   forget <spell>
///   tick                    status      quit

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "sre/foundation/config_manager.hpp"
#include "sre/foundation/game_logger.hpp"
#include "sre/magic/accuracy_oracle.hpp"
#include "sre/magic/room_registry.hpp"
#include "sre/magic/spell_engine.hpp"
#include "sre/magic/yaml_catalog.hpp"
#include "sre/version.hpp"

namespace {

using sre::foundation::PlayerId;
using sre::foundation::RoomId;

constexpr RoomId kSandboxRoom{1};

/// Prints every message to stdout, tagged with the recipient.
class ConsoleMessaging final : public sre::magic::IMessaging {
public:
    explicit ConsoleMessaging(const sre::magic::RoomRegistry& rooms) : rooms_(rooms) {}

    void SendToPlayer(PlayerId player, std::string_view text) override {
        std::cout << "[" << nameOf(player) << "] " << text << "\n";
    }

    void BroadcastRoomExcept(RoomId room, std::optional<PlayerId> except,
                             std::string_view text) override {
        for (const auto& player : rooms_.ListPlayers(room)) {
            if (!except || player->playerId != *except) {
                SendToPlayer(player->playerId, text);
            }
        }
    }

private:
    std::string nameOf(PlayerId player) const {
        auto character = rooms_.FindPlayer(player);
        return character ? character->name : "#" + std::to_string(player.value());
    }

    const sre::magic::RoomRegistry& rooms_;
};

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

template <typename Catalog>
bool loadCatalog(Catalog& catalog, const std::filesystem::path& path, std::string_view what) {
    auto result = catalog.LoadFile(path);
    if (!result) {
        std::cerr << "Failed to load " << what << ": " << result.error().message() << "\n";
        return false;
    }
    std::cout << "Loaded " << result.value() << " " << what << " from " << path << "\n";
    return true;
}

std::shared_ptr<sre::magic::Character> makeCharacter(uint64_t id, std::string name,
                                                     std::string characterClass,
                                                     int32_t level) {
    auto character = std::make_shared<sre::magic::Character>();
    character->playerId = PlayerId{id};
    character->name = std::move(name);
    character->room = kSandboxRoom;
    character->level = level;
    character->resources.characterClass = std::move(characterClass);
    character->vitals.maxHealth = 60;
    character->vitals.health = 60;
    character->vitals.maxMana = 80;
    character->vitals.mana = 80;
    character->stats.Set(sre::magic::Stat::Intellect, 16);
    return character;
}

void printStatus(const sre::magic::RoomRegistry& rooms) {
    for (const auto& player : rooms.ListPlayers(kSandboxRoom)) {
        std::cout << "  " << player->name << ": HP " << player->vitals.health << "/"
                  << player->vitals.maxHealth << ", MP " << player->vitals.mana << "/"
                  << player->vitals.maxMana << ", effects " << player->effects.Size() << "\n";
    }
    for (const auto& mob : rooms.ListMobs(kSandboxRoom)) {
        std::cout << "  " << mob->name << (mob->summoned ? " (summoned)" : "") << ": HP "
                  << mob->vitals.health << "/" << mob->vitals.maxHealth << ", effects "
                  << mob->effects.Size() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/sandbox.yaml";
    }
    if (const char* envPath = std::getenv("SRE_CONFIG_PATH")) {
        configPath = envPath;
    }

    sre::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto engineConfig = sre::magic::EngineConfig::FromConfig(config);
    auto dataDir = std::filesystem::path(config.getOr<std::string>("sandbox.data_dir", "data"));

    sre::magic::YamlSpellCatalog spells;
    sre::magic::YamlClassCatalog classes(engineConfig.defaultMaxSpellLevel);
    sre::magic::YamlCreatureCatalog creatures;
    if (!loadCatalog(spells, dataDir / "spells.yaml", "spells") ||
        !loadCatalog(classes, dataDir / "classes.yaml", "classes") ||
        !loadCatalog(creatures, dataDir / "monsters.yaml", "creature templates")) {
        return EXIT_FAILURE;
    }

    sre::magic::RoomRegistry rooms;
    sre::magic::PartyRoster parties;
    ConsoleMessaging messaging(rooms);
    sre::magic::StdRandom random;
    sre::magic::SystemClock clock;
    sre::magic::StandardAccuracyOracle accuracy(random);

    sre::magic::EngineServices services{spells,   classes,  accuracy, rooms,
                                        rooms,    rooms,    creatures, parties,
                                        messaging, clock,   random};
    sre::magic::SpellEngine engine(services, engineConfig);

    auto mage = makeCharacter(1, "Aldric", config.getOr<std::string>("sandbox.class", "mage"),
                              static_cast<int32_t>(config.getOr<int64_t>("sandbox.level", 12)));
    auto cleric = makeCharacter(2, "Brenna", "cleric", 8);
    cleric->vitals.health = 35;
    for (const char* id : {"magic_missile", "fireball", "poison_cloud", "heal", "mass_heal",
                           "shield", "giant_strength", "hold_monster", "mana_leech",
                           "enervate", "animate_dead", "cure_poison"}) {
        if (spells.Get(id) != nullptr) {
            mage->spellbook.emplace_back(id);
        }
    }
    rooms.AddPlayer(mage);
    rooms.AddPlayer(cleric);

    for (const auto& tmpl : creatures.All()) {
        if (!tmpl.specialTerrainOnly && rooms.MobCount(kSandboxRoom) < 3) {
            rooms.AddMob(kSandboxRoom, std::make_shared<sre::magic::Mob>(instantiate(tmpl)));
        }
    }

    SRE_LOG_INFO(sre::foundation::LogCategory::Core,
                 std::string("Spell engine sandbox ") + sre::Version::string + " ready");
    std::cout << "Type 'quit' to exit.\n";

    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream words(line);
        std::string command;
        words >> command;
        std::string rest;
        std::getline(words, rest);

        if (command == "quit") {
            break;
        }
        if (command == "cast") {
            auto outcome = engine.CastSpell(*mage, rest);
            std::cout << "  -> " << sre::magic::castOutcomeName(outcome) << "\n";
        } else if (command == "tick") {
            engine.TickCooldowns(*mage);
            for (const auto& player : rooms.ListPlayers(kSandboxRoom)) {
                engine.Tick(*player);
            }
            for (const auto& mob : rooms.ListMobs(kSandboxRoom)) {
                engine.Tick(*mob);
            }
        } else if (command == "spellbook") {
            std::cout << engine.DescribeSpellbook(*mage);
        } else if (command == "forget") {
            engine.ForgetSpell(*mage, rest);
        } else if (command == "status") {
            printStatus(rooms);
        } else if (!command.empty()) {
            std::cout << "Unknown command: " << command << "\n";
        }
    }

    sre::foundation::GameLogger::instance().flush();
    return EXIT_SUCCESS;
}
