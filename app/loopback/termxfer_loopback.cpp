#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Config.h"
#include "FileDiscovery.h"
#include "HostInterfaces.h"
#include "Logger.h"
#include "PathUtils.h"
#include "Requestor.h"
#include "Sender.h"
#include "TerminalBroker.h"
#include "TransferErrors.h"
#include "TransferSettings.h"
#include "WireCodec.h"

using namespace TermXfer;

namespace {

/**
 * Single-threaded event loop standing in for the terminal's: timers fire in
 * deadline order, payloads are delivered in write order.
 */
class EventLoop : public ITimerScheduler {
public:
    using Clock = std::chrono::steady_clock;

    void callAfter(std::chrono::milliseconds delay, std::function<void()> callback) override {
        timers_.emplace(Clock::now() + delay, std::move(callback));
    }

    bool runDue() {
        bool ran = false;
        while (!timers_.empty() && timers_.begin()->first <= Clock::now()) {
            auto cb = std::move(timers_.begin()->second);
            timers_.erase(timers_.begin());
            cb();
            ran = true;
        }
        return ran;
    }

    bool idle() const { return timers_.empty(); }

    void waitForNextTimer() const {
        if (!timers_.empty()) {
            std::this_thread::sleep_until(timers_.begin()->first);
        }
    }

private:
    std::multimap<Clock::time_point, std::function<void()>> timers_;
};

/// One direction of the escape-code channel.
class Pipe : public ITransferChannel {
public:
    bool write(const std::string& payload) override {
        queue_.push_back(WireCodec::wrapEscapeCode(payload));
        return true;
    }

    bool empty() const { return queue_.empty(); }

    std::string pop() {
        std::string envelope = std::move(queue_.front());
        queue_.pop_front();
        return WireCodec::unwrapEscapeCode(envelope);
    }

private:
    std::deque<std::string> queue_;
};

class ConsolePrompt : public IPermissionPrompt {
public:
    enum class Mode { Allow, Deny, Ask };

    explicit ConsolePrompt(Mode mode) : mode_(mode) {}

    void askYesNo(const std::string& message, std::function<void(bool)> done) override {
        if (mode_ != Mode::Ask) {
            done(mode_ == Mode::Allow);
            return;
        }
        std::cout << message << " [y/N] " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        done(answer == "y" || answer == "Y" || answer == "yes");
    }

private:
    Mode mode_;
};

/// Pull flow on the local side: feeds terminal replies to a Requestor.
class PullDriver {
public:
    PullDriver(Requestor& requestor, ITransferChannel& channel)
        : requestor_(requestor), channel_(channel) {}

    void start() {
        for (const auto& msg : requestor_.startTransfer()) {
            write(msg);
        }
    }

    void onMessage(const Message& msg) {
        if (exitCode_ || msg.transferId != requestor_.transferId()) {
            return;
        }
        RequestState before = requestor_.state();
        auto handled = requestor_.onFileTransferResponse(msg);
        if (!handled) {
            fail(handled.error().toString());
            return;
        }
        if (before == RequestState::WaitingForFileMetadata && requestor_.state() == RequestState::Transferring) {
            auto specs = requestor_.checkSpecs();
            if (!specs) {
                fail(specs.error().toString());
                return;
            }
            requestor_.collectFiles();
            auto requests = requestor_.requestFiles();
            if (requests.empty()) {
                auto done = requestor_.finalize();
                if (!done) {
                    fail(done.error().toString());
                    return;
                }
            }
            for (const auto& req : requests) {
                write(req);
            }
        }
        if (requestor_.transferDone()) {
            write(requestor_.finishMessage());
            exitCode_ = 0;
        }
    }

    std::optional<int> exitCode() const { return exitCode_; }

private:
    void write(const Message& msg) {
        channel_.write(WireCodec::serialize(msg));
    }

    void fail(const std::string& why) {
        std::cerr << "Transfer failed: " << why << std::endl;
        write(requestor_.cancelMessage());
        exitCode_ = 1;
    }

    Requestor& requestor_;
    ITransferChannel& channel_;
    std::optional<int> exitCode_;
};

void printUsage(const char* argv0) {
    std::cout << "termxfer_loopback - run a file transfer through an in-process terminal" << std::endl;
    std::cout << "\nUsage: " << argv0 << " [OPTIONS] SOURCE... DESTINATION" << std::endl;
    std::cout << "       " << argv0 << " --mirror [OPTIONS] SOURCE..." << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <FILE>     Load settings from a key=value file" << std::endl;
    std::cout << "  --home <DIR>        Home directory of the terminal side (default: $HOME)" << std::endl;
    std::cout << "  --pull              Fetch SOURCE paths from the terminal side instead of pushing" << std::endl;
    std::cout << "  --mirror            Reproduce local paths relative to the home directory" << std::endl;
    std::cout << "  --rsync             Send deltas against existing destination files" << std::endl;
    std::cout << "  --bypass <SECRET>   Skip the permission prompt using a shared secret" << std::endl;
    std::cout << "  --ask               Ask on the console before accepting a transfer" << std::endl;
    std::cout << "  --deny              Refuse every transfer" << std::endl;
    std::cout << "  --help              Show this help message" << std::endl;
}

void setupLogging(const Config& config) {
    auto& logger = Logger::instance();
    logger.setComponent("Loopback");
    logger.setLevel(Logger::parseLevel(config.get("log.level", "warn"), LogLevel::WARN));
    std::string logFile = config.get("log.file", "");
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setMaxFileSize(static_cast<size_t>(config.getSize("log.max_size_mb", 100)));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string home;
    std::string bypass;
    bool pull = false;
    bool mirror = false;
    bool rsync = false;
    ConsolePrompt::Mode promptMode = ConsolePrompt::Mode::Allow;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--home" && i + 1 < argc) {
            home = argv[++i];
        } else if (arg == "--bypass" && i + 1 < argc) {
            bypass = argv[++i];
        } else if (arg == "--pull") {
            pull = true;
        } else if (arg == "--mirror") {
            mirror = true;
        } else if (arg == "--rsync") {
            rsync = true;
        } else if (arg == "--ask") {
            promptMode = ConsolePrompt::Mode::Ask;
        } else if (arg == "--deny") {
            promptMode = ConsolePrompt::Mode::Deny;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    Config config;
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        std::cerr << "Could not read config file " << configPath << std::endl;
        return 2;
    }
    setupLogging(config);

    TransferSettings settings = TransferSettings::fromConfig(config);
    if (!bypass.empty() && settings.bypassSecret.empty()) {
        settings.bypassSecret = bypass;
    }

    if (args.empty() || (!mirror && args.size() < 2)) {
        printUsage(argv[0]);
        return 2;
    }

    PathContext local;
    PathContext terminal = home.empty() ? PathContext() : PathContext(home, local.cwd());

    EventLoop loop;
    Pipe toTerminal;
    Pipe toLocal;
    ConsolePrompt prompt(promptMode);
    TerminalBroker broker(toLocal, prompt, loop, settings, terminal);

    std::unique_ptr<Sender> sender;
    std::unique_ptr<Requestor> requestor;
    std::unique_ptr<PullDriver> puller;

    try {
        if (pull) {
            std::vector<std::string> specs = args;
            std::string dest;
            if (!mirror) {
                dest = specs.back();
                specs.pop_back();
            }
            requestor = std::make_unique<Requestor>(WireCodec::randomTransferId(), specs, dest, local, bypass, mirror);
            puller = std::make_unique<PullDriver>(*requestor, toTerminal);
            puller->start();
        } else {
            FileDiscovery discovery(local);
            SendFileList files = discovery.filesForSend(mirror ? SendMode::Mirror : SendMode::Normal, args);
            SendOptions options;
            options.bypassSecret = bypass;
            options.useRsync = rsync;
            sender = std::make_unique<Sender>(toTerminal, loop, std::move(files), settings, options);
            sender->setFileDoneCallback([](const SendFile& f) {
                if (f.errorMessage.empty()) {
                    std::cout << f.displayName << std::endl;
                }
            });
            sender->start();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to start transfer: " << e.what() << std::endl;
        return 1;
    }

    auto exitCode = [&]() -> std::optional<int> {
        return sender ? sender->exitCode() : puller->exitCode();
    };

    while (!exitCode()) {
        bool work = false;
        try {
            while (!toTerminal.empty()) {
                broker.handleSerializedCommand(toTerminal.pop());
                work = true;
            }
            while (!toLocal.empty()) {
                Message msg = WireCodec::deserialize(toLocal.pop());
                if (sender) {
                    sender->onMessage(msg);
                } else {
                    puller->onMessage(msg);
                }
                work = true;
            }
        } catch (const ProtocolError& e) {
            std::cerr << "Protocol error: " << e.what() << std::endl;
            return 1;
        }
        if (loop.runDue()) {
            work = true;
        }
        if (!work) {
            if (loop.idle()) {
                std::cerr << "Transfer stalled" << std::endl;
                return 1;
            }
            loop.waitForNextTimer();
        }
    }

    // Let the terminal side see the final messages
    while (!toTerminal.empty()) {
        broker.handleSerializedCommand(toTerminal.pop());
    }

    if (sender) {
        std::string report = sender->failureReport();
        if (!report.empty()) {
            std::cerr << "Failed to send some files:\n" << report;
        }
    }
    return *exitCode();
}
