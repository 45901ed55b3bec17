/**
 * terminal_cli.h - Line-oriented command interface
 *
 * Plain mode reads commands from stdin:
 *   nearlink> send DNC-Laptop hello
 *
 * Daemon mode reads nothing and keeps the node running until stop() is called
 * (from a signal handler or a peer event).
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include "message_types.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

class P2PNode;

class TerminalCLI {
public:
    explicit TerminalCLI(P2PNode& node, bool daemon_mode = false);
    ~TerminalCLI();

    TerminalCLI(const TerminalCLI&) = delete;
    TerminalCLI& operator=(const TerminalCLI&) = delete;

    void run();
    void stop();
    bool isRunning() const { return running; }

    // Parses and executes one command line. Public so scripts and tests can drive it.
    void process_command(const std::string& input);

    // Callbacks from node (engine threads)
    void on_peer_discovered(const std::string& peer_id);
    void on_peer_connected(const std::string& peer_id);
    void on_peer_disconnected(const std::string& peer_id, const std::string& reason);
    void on_message_received(const std::string& from, MessageType type, const std::string& payload);
    void on_notification(const std::string& message);

private:
    P2PNode& node;
    bool daemon_mode_;
    std::atomic<bool> running;

    // Serializes terminal output from engine threads and the input loop
    std::mutex output_mutex;

    void run_plain();
    void run_daemon();

    void print_line(const std::string& line);
    void print_lines(const std::vector<std::string>& lines);

    // Command handlers
    void cmd_help();
    void cmd_quit();
    void cmd_list_peers();
    void cmd_connect(const std::string& peer_id, const std::string& ip);
    void cmd_disconnect(const std::string& peer_id);
    void cmd_send(const std::string& peer_id, const std::string& message);
    void cmd_command(const std::string& peer_id, const std::string& command, const std::string& args);
    void cmd_file(const std::string& peer_id, const std::string& path);
    void cmd_broadcast(const std::string& message);
    void cmd_scan();
    void cmd_status();
};

#endif // TERMINAL_CLI_H
