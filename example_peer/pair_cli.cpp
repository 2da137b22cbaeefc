// Core API
#include "ktnsync/ktnsync.hpp"

// Transport for pairing on the local network
#include "ktnsync/transports/tcp/tcp_direct_transport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <string>
#include <unistd.h>

using namespace ktnsync;

namespace {

    struct CliArgs {
        std::string role;
        std::string storePath;
        std::optional<std::string> configPath;
        std::string logLevel{ "info" };
        bool bindLoopback{ false };
    };

    void usage(const char* argv0) {
        std::cerr << "usage: " << argv0
                  << " --role initiator|responder --store file.json"
                     " [--config opts.json] [--log-level trace|debug|info|warn|error] [--bind-loopback]\n";
    }

    std::optional<CliArgs> parseArgs(int argc, char** argv) {
        CliArgs a;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&](std::string& out) {
                if (i + 1 >= argc) return false;
                out = argv[++i];
                return true;
            };
            if (arg == "--role") {
                if (!value(a.role)) return std::nullopt;
            } else if (arg == "--store") {
                if (!value(a.storePath)) return std::nullopt;
            } else if (arg == "--config") {
                std::string p;
                if (!value(p)) return std::nullopt;
                a.configPath = p;
            } else if (arg == "--log-level") {
                if (!value(a.logLevel)) return std::nullopt;
            } else if (arg == "--bind-loopback") {
                a.bindLoopback = true;
            } else {
                std::cerr << "unknown argument: " << arg << '\n';
                return std::nullopt;
            }
        }
        if ((a.role != "initiator" && a.role != "responder") || a.storePath.empty()) return std::nullopt;
        return a;
    }

    void loadStore(MemoryStore& store, const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            LOG_INFO("No store at " + path + ", starting empty");
            return;
        }
        nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
        if (doc.is_discarded()) throw SyncError(SyncErr::Internal, "store file " + path + " is not valid JSON");
        store.fromJson(doc);
        LOG_INFO("Loaded " + std::to_string(store.folderCount()) + " folders, " +
                 std::to_string(store.notebookCount()) + " notebooks, " +
                 std::to_string(store.noteCount()) + " notes");
    }

    bool saveStore(const MemoryStore& store, const std::string& path) {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            LOG_ERROR("Cannot write store file " + path);
            return false;
        }
        out << store.toJson().dump(2) << '\n';
        return static_cast<bool>(out);
    }

    void printTransfer(const SyncEvent& ev) {
        std::cout << "\n" << ev.message << " (" << ev.transfer.size() << " part"
                  << (ev.transfer.size() == 1 ? "" : "s") << "):\n";
        for (const auto& s : ev.transfer) std::cout << s << "\n";
        std::cout << std::endl;
    }

    /* Reads console lines on the io_context; an empty line flushes the scanned parts. */
    class ConsoleReader {
    public:
        ConsoleReader(boost::asio::io_context& io, SyncSession& session)
            : input_(io), session_(session) {}

        bool start() {
            boost::system::error_code ec;
            input_.assign(::dup(STDIN_FILENO), ec);
            if (ec) {
                LOG_ERROR("Cannot read console input: " + ec.message());
                return false;
            }
            readLine();
            return true;
        }

        void stop() {
            boost::system::error_code ec;
            input_.close(ec);
        }

    private:
        void readLine() {
            boost::asio::async_read_until(input_, buf_, '\n',
                [this](const boost::system::error_code& ec, size_t) {
                    if (ec == boost::asio::error::operation_aborted) return;
                    if (buf_.size() > 0) {
                        std::istream in(&buf_);
                        std::string line;
                        std::getline(in, line);
                        deliver(line);
                    }
                    if (ec) {
                        LOG_DEBUG("Console input closed: " + ec.message());
                        return;
                    }
                    readLine();
                });
        }

        void deliver(const std::string& line) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) session_.finishScan();
            else session_.submitScan(line);
        }

        boost::asio::posix::stream_descriptor input_;
        boost::asio::streambuf                buf_;
        SyncSession&                          session_;
    };

}

int main(int argc, char** argv) {
    auto args = parseArgs(argc, argv);
    if (!args) {
        usage(argv[0]);
        return 2;
    }

    auto level = parseLogLevel(args->logLevel);
    if (!level) {
        std::cerr << "unknown log level: " << args->logLevel << '\n';
        return 2;
    }
    Logger::inst().setLevel(*level);
    Logger::inst().setSink([](LogLevel l, const std::string& m) {
        static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
        std::cerr << "[" << names[(int)l] << "] " << m << '\n';
    });

    SyncOptions opts;
    MemoryStore store;
    try {
        if (args->configPath) opts = loadSyncOptions(*args->configPath);
        loadStore(store, args->storePath);
    }
    catch (const SyncError& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    TcpTransportOptions tcpOpts;
    tcpOpts.loopbackOnly = args->bindLoopback;
    TcpDirectTransport transport(io, tcpOpts);

    DeviceIdentityManager identity(store);
    SyncSession session(io, transport, store, identity, opts);

    int exitCode = 1;
    session.setEventHandler([&](const SyncEvent& ev) {
        switch (ev.kind) {
        case SyncEventKind::Stage:
            std::cout << "-- " << ev.message << std::endl;
            break;
        case SyncEventKind::OfferReady:
        case SyncEventKind::AnswerReady:
            printTransfer(ev);
            if (ev.kind == SyncEventKind::OfferReady)
                std::cout << "Paste the answer from the other device, one part per line:" << std::endl;
            break;
        case SyncEventKind::FragmentReceived:
            std::cout << "   " << ev.message << std::endl;
            break;
        case SyncEventKind::Warning:
            std::cout << "!! " << ev.message << std::endl;
            break;
        case SyncEventKind::Failed:
            std::cout << "xx " << ev.message << std::endl;
            boost::asio::post(io, [&] { io.stop(); });
            break;
        case SyncEventKind::Completed:
            std::cout << "Synced: " << ev.counts.folders << " folders, " << ev.counts.notebooks
                      << " notebooks, " << ev.counts.notes << " notes";
            if (ev.counts.failed) std::cout << " (" << ev.counts.failed << " skipped)";
            std::cout << std::endl;
            exitCode = saveStore(store, args->storePath) ? 0 : 1;
            boost::asio::post(io, [&] { io.stop(); });
            break;
        }
    });

    try {
        if (args->role == "initiator") session.startAsInitiator();
        else {
            session.startAsResponder();
            std::cout << "Paste the offer from the other device, one part per line"
                         " (an empty line uses the parts pasted so far):" << std::endl;
        }
    }
    catch (const SyncError& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    ConsoleReader reader(io, session);
    if (!reader.start()) return 1;

    io.run();

    // Closing flushes frames still queued for the peer; bound the wait for it.
    reader.stop();
    session.close();
    work.reset();
    io.restart();
    io.run_for(std::chrono::seconds(2));
    return exitCode;
}
