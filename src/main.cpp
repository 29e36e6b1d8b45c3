#include <FL/Fl.H>
#include <FL/x.H>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "layout/FlTextMeasurer.h"
#include "layout/LayoutEngine.h"
#include "state/MemoryPressureRelay.h"
#include "state/ThreadController.h"
#include "utils/Errors.h"
#include "utils/Logger.h"
#include "utils/Time.h"

namespace {

const int DEFAULT_WIDTH = 375;

struct Options {
    std::string conversationPath;
    std::string configPath;
    int width = DEFAULT_WIDTH;
    bool typing = false;
};

class ConversationSource : public MessageSource {
  public:
    ConversationSource(std::string currentUserId, std::vector<std::vector<Message>> sections)
        : m_currentUserId(std::move(currentUserId)), m_sections(std::move(sections)) {}

    int sectionCount() const override { return static_cast<int>(m_sections.size()); }
    int itemCount(int section) const override { return static_cast<int>(m_sections.at(section).size()); }
    Message message(const IndexPath &position) const override {
        return m_sections.at(position.section).at(position.item);
    }
    bool isMine(const Message &message) const override { return message.sender.id == m_currentUserId; }

    std::optional<StyledText> timestampLabelText(const Message &message, const IndexPath &) const override {
        return StyledText(TimeUtils::formatClock(message.sentAt), FontSpec{FL_HELVETICA, 11});
    }

    bool startsRun(const IndexPath &position) const {
        if (position.item == 0) {
            return true;
        }
        const auto &section = m_sections.at(position.section);
        return section.at(position.item - 1).sender.id != section.at(position.item).sender.id;
    }

  private:
    std::string m_currentUserId;
    std::vector<std::vector<Message>> m_sections;
};

// Date caption above each section, sender name at the start of a run, delivery status under own messages
class DemoPolicy : public LayoutPolicy {
  public:
    explicit DemoPolicy(const ConversationSource &source) : m_source(source) {}

    int cellTopLabelHeight(const Message &, const IndexPath &position) const override {
        return position.item == 0 ? 18 : 0;
    }
    int cellBottomLabelHeight(const Message &, const IndexPath &) const override { return 0; }
    int messageTopLabelHeight(const Message &message, const IndexPath &position) const override {
        return !m_source.isMine(message) && m_source.startsRun(position) ? 20 : 0;
    }
    int messageBottomLabelHeight(const Message &message, const IndexPath &) const override {
        return m_source.isMine(message) ? 16 : 0;
    }

    bool layoutDependsOnPosition() const override { return true; }
    Size headerSize(int section) const override { return section == 0 ? Size{0, 8} : Size{0, 16}; }

  private:
    const ConversationSource &m_source;
};

class ConsoleSink : public PresentationSink {
  public:
    explicit ConsoleSink(LayoutEngine &engine) : m_engine(engine) {}

    void applyStructural(const UpdatePlan &plan, bool) override {
        std::cout << "structural update: " << plan.entries.size() << " entries, " << plan.inserted.size()
                  << " inserted, " << plan.removed.size() << " removed\n";
        for (size_t i = 0; i < plan.entries.size(); ++i) {
            printCell(i);
        }
        std::cout << "content height " << m_engine.contentHeight() << "\n";
    }

    void applyRefresh(const UpdatePlan &plan, bool) override {
        std::cout << "selective refresh of " << plan.refreshed.size() << " entries\n";
        for (const auto &refresh : plan.refreshed) {
            printCell(refresh.index);
        }
    }

  private:
    void printCell(size_t index) {
        const Entry &entry = m_engine.entries().at(index);
        const LayoutAttributes attributes = m_engine.attributesAt(index);
        const Size size = m_engine.sizeAt(index);

        const char *kind = entry.isTypingIndicator() ? "typing" : kindName(entry.message()->tag());
        std::cout << std::setw(3) << index << "  " << std::left << std::setw(14) << entry.id() << std::setw(16)
                  << kind << std::right << " cell " << size.width << "x" << size.height << " container "
                  << attributes.messageContainerSize.width << "x" << attributes.messageContainerSize.height
                  << " avatar " << toString(attributes.avatarPosition.horizontal) << "/"
                  << toString(attributes.avatarPosition.vertical) << " y=" << m_engine.offsetAt(index) << "\n";
    }

    LayoutEngine &m_engine;
};

void printUsage(const char *program) {
    std::cerr << "usage: " << program
              << " <conversation.json> [--width N] [--config style.json] [--typing] [--log-level LEVEL]\n";
}

std::optional<Options> parseArguments(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--width" && i + 1 < argc) {
            try {
                options.width = std::stoi(argv[++i]);
            } catch (const std::exception &e) {
                Logger::error("Invalid width '" + std::string(argv[i]) + "': " + e.what());
                return std::nullopt;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--typing") {
            options.typing = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = Logger::levelFromString(argv[++i]);
            if (!level) {
                Logger::error("Unknown log level '" + std::string(argv[i]) + "'");
                return std::nullopt;
            }
            Logger::setLevel(*level);
        } else if (!arg.empty() && arg[0] != '-' && options.conversationPath.empty()) {
            options.conversationPath = arg;
        } else {
            return std::nullopt;
        }
    }

    if (options.conversationPath.empty()) {
        return std::nullopt;
    }
    return options;
}

std::optional<ConversationSource> loadConversation(const std::string &path, const FontSpec &textFont) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::error("Cannot open conversation " + path);
            return std::nullopt;
        }

        nlohmann::json data;
        file >> data;

        std::vector<std::vector<Message>> sections;
        for (const auto &sectionJson : data.at("sections")) {
            std::vector<Message> messages;
            for (const auto &messageJson : sectionJson) {
                messages.push_back(Message::fromJson(messageJson, textFont));
            }
            sections.push_back(std::move(messages));
        }

        return ConversationSource(data.at("me").get<std::string>(), std::move(sections));
    } catch (const std::exception &e) {
        Logger::error("Failed to load conversation " + path + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char **argv) {
    Fl::lock();
    Logger::configureFromEnvironment();

    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    SizingConfiguration config;
    if (!options->configPath.empty()) {
        auto loaded = SizingConfiguration::loadFromFile(options->configPath);
        if (!loaded) {
            return EXIT_FAILURE;
        }
        config = *loaded;
    }

    auto source = loadConversation(options->conversationPath, config.messageLabelFont);
    if (!source) {
        return EXIT_FAILURE;
    }

    // FLTK needs a display connection before it can report font metrics
    fl_open_display();

    FlTextMeasurer measurer;
    DemoPolicy policy(*source);

    LayoutEngine engine(config);
    engine.setMessageSource(&*source);
    engine.setLayoutPolicy(&policy);
    engine.setTextMeasurer(&measurer);
    engine.setAvailableWidth(options->width);

    MemoryPressureRelay relay(engine);
    ConsoleSink sink(engine);
    ThreadController controller(engine, &sink);

    try {
        controller.update(false);
        if (options->typing) {
            controller.setTypingIndicatorHidden(false, true);
        }

        relay.notify();
        Fl::check();
        controller.update(false, [&engine]() {
            Logger::info("Cache after memory signal: " + std::to_string(engine.cache().size()) + " entries, " +
                         std::to_string(engine.cache().misses()) + " misses");
        });
    } catch (const PreconditionFailure &e) {
        Logger::error(std::string("Layout aborted: ") + e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
