#include "replay_bridge/gdb_mi_process.hpp"
#include "logger.hpp"

GdbMiProcess::~GdbMiProcess() {
    if (process.isRunning()) {
        process.writeAll("-gdb-exit\n");
        process.closeInput();
    }
    if (readerThread.joinable()) {
        readerThread.join();
    }
    process.wait();
}

void GdbMiProcess::start(const std::string& gdbExecutable, const std::vector<std::string>& extraArgs) {
    std::vector<std::string> argv = {gdbExecutable, "-q", "-nx", "-l", "-1", "--interpreter=mi2"};
    argv.insert(argv.end(), extraArgs.begin(), extraArgs.end());

    if (!process.spawn(argv)) {
        throw MiTransportError("Could not start " + gdbExecutable);
    }
    readerThread = std::thread([this] { readLoop(); });
}

void GdbMiProcess::setNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex);
    notificationHandler = std::move(handler);
}

void GdbMiProcess::setCloseHandler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(mutex);
    closeHandler = std::move(handler);
}

MiRecord GdbMiProcess::send(const std::string& command, const std::vector<std::string>& args) {
    long token;
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw MiTransportError("gdb has exited; cannot send -" + command);
        }
        token = nextToken++;
    }

    line = std::to_string(token) + "-" + command;
    for (const auto& arg : args) {
        line += " " + quoteMiArgument(arg);
    }
    line += "\n";

    if (!process.writeAll(line)) {
        throw MiTransportError("Failed writing -" + command + " to gdb");
    }

    std::unique_lock<std::mutex> lock(mutex);
    responseReady.wait(lock, [&] { return closed || responses.count(token) > 0; });

    auto it = responses.find(token);
    if (it == responses.end()) {
        throw MiTransportError("gdb exited before answering -" + command);
    }
    MiRecord record = std::move(it->second);
    responses.erase(it);
    return record;
}

void GdbMiProcess::readLoop() {
    std::string line;
    while (process.readLine(line)) {
        MiRecord record = parseMiLine(line);

        switch (record.kind) {
            case MiRecord::Kind::RESULT:
                if (record.token) {
                    std::lock_guard<std::mutex> lock(mutex);
                    responses[*record.token] = std::move(record);
                    responseReady.notify_all();
                } else {
                    LOG_DEBUG("Untokened result record from gdb: ", record.raw);
                }
                break;

            case MiRecord::Kind::EXEC_ASYNC:
            case MiRecord::Kind::STATUS_ASYNC:
            case MiRecord::Kind::NOTIFY_ASYNC: {
                NotificationHandler handler;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    handler = notificationHandler;
                }
                if (handler) {
                    handler(record);
                }
                break;
            }

            case MiRecord::Kind::CONSOLE_STREAM:
            case MiRecord::Kind::TARGET_STREAM:
            case MiRecord::Kind::LOG_STREAM:
                LOG_TRACE("gdb: ", record.text);
                break;

            case MiRecord::Kind::PROMPT:
                break;

            case MiRecord::Kind::UNKNOWN:
                LOG_TRACE("gdb (non-MI): ", record.raw);
                break;
        }
    }

    LOG_DEBUG("gdb output closed");
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        handler = closeHandler;
        responseReady.notify_all();
    }
    if (handler) {
        handler();
    }
}
