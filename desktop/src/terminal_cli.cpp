/**
 * terminal_cli.cpp - Line-oriented command interface
 *
 * All terminal output goes through print_line() so lines written from engine
 * threads never interleave with command output.
 */

#include "terminal_cli.h"
#include "p2p_node.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

// ═══════════════════════════════════════════════════════════════════════════
// ANSI COLORS
// ═══════════════════════════════════════════════════════════════════════════

#define C_RESET      "\033[0m"
#define C_DIM        "\033[2m"
#define C_RED        "\033[31m"
#define C_GREEN      "\033[32m"
#define C_YELLOW     "\033[33m"
#define C_CYAN       "\033[36m"
#define C_BGREEN     "\033[92m"

namespace {

std::string rest_of_line(std::istringstream& iss) {
    std::string text;
    std::getline(iss, text);
    const size_t first = text.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : text.substr(first);
}

// Exact id, else a unique prefix of an id or display name. Empty when none or ambiguous.
std::string resolve_peer_id(const std::vector<PeerDescriptor>& peers, const std::string& query,
                            std::vector<std::string>* matches_out) {
    std::vector<std::string> matches;
    for (const auto& p : peers) {
        if (p.peer_id == query) {
            return p.peer_id;
        }
        if (p.peer_id.rfind(query, 0) == 0 || p.display_name.rfind(query, 0) == 0) {
            matches.push_back(p.peer_id);
        }
    }
    if (matches_out) {
        *matches_out = matches;
    }
    return matches.size() == 1 ? matches.front() : std::string();
}

} // namespace

TerminalCLI::TerminalCLI(P2PNode& p2p_node, bool daemon_mode)
    : node(p2p_node)
    , daemon_mode_(daemon_mode)
    , running(false)
{
    // Wire engine events into the CLI. These callbacks may be invoked from engine threads.
    node.setPeerEventCallbacks(
        [this](const std::string& peer_id) { this->on_peer_discovered(peer_id); },
        [this](const std::string& peer_id) { this->on_peer_connected(peer_id); },
        [this](const std::string& peer_id, const std::string& reason) {
            this->on_peer_disconnected(peer_id, reason);
        }
    );
    node.setMessageEventCallback(
        [this](const std::string& peer_id, MessageType type, const std::string& payload) {
            this->on_message_received(peer_id, type, payload);
        }
    );
    node.setNotificationCallback(
        [this](const std::string& message) { this->on_notification(message); }
    );
}

TerminalCLI::~TerminalCLI() {
    // Prevent callbacks into a destroyed UI.
    node.clearEventCallbacks();
}

void TerminalCLI::run() {
    running = true;

    if (daemon_mode_) {
        run_daemon();
        return;
    }
    run_plain();
}

void TerminalCLI::run_plain() {
    // No /dev/tty requirements and no stream redirection; suitable for scripting.
    print_line("nearlink (plain mode). Type 'help' for commands. Ctrl-D/Ctrl-C to exit.");

    std::string line;
    while (running) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "nearlink> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        process_command(line);
    }

    print_line("Goodbye!");
}

void TerminalCLI::run_daemon() {
    print_line("nearlink daemon mode started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    print_line("Peer ID: " + node.getPeerId());

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    print_line("Goodbye!");
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << std::endl;
}

void TerminalCLI::print_lines(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(output_mutex);
    for (const auto& line : lines) {
        std::cout << line << "\n";
    }
    std::cout << std::flush;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENGINE CALLBACKS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::on_peer_discovered(const std::string& peer_id) {
    print_line(C_CYAN "[+] Discovered " + peer_id + C_RESET);
}

void TerminalCLI::on_peer_connected(const std::string& peer_id) {
    print_line(C_BGREEN "[*] Connected: " + peer_id + C_RESET);
}

void TerminalCLI::on_peer_disconnected(const std::string& peer_id, const std::string& reason) {
    print_line(C_YELLOW "[-] Disconnected: " + peer_id + " (" + reason + ")" C_RESET);
}

void TerminalCLI::on_message_received(const std::string& from, MessageType type, const std::string& payload) {
    switch (type) {
        case MessageType::TEXT:
            print_line(C_GREEN "<" + from + "> " C_RESET + payload);
            break;
        case MessageType::COMMAND:
            print_line(C_CYAN "[cmd] " + from + ": " + payload + C_RESET);
            break;
        case MessageType::STATUS:
            print_line(C_DIM "[status] " + from + ": " + payload + C_RESET);
            break;
        case MessageType::ERROR:
            print_line(C_RED "[error] " + from + ": " + payload + C_RESET);
            break;
        default:
            break;
    }
}

void TerminalCLI::on_notification(const std::string& message) {
    print_line(C_DIM "[i] " + message + C_RESET);
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMAND PROCESSING
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        cmd_quit();
    } else if (cmd == "peers" || cmd == "list" || cmd == "ls") {
        cmd_list_peers();
    } else if (cmd == "connect" || cmd == "c") {
        std::string peer_id;
        std::string ip;
        iss >> peer_id >> ip;
        cmd_connect(peer_id, ip);
    } else if (cmd == "disconnect" || cmd == "dc") {
        std::string peer_id;
        iss >> peer_id;
        cmd_disconnect(peer_id);
    } else if (cmd == "send" || cmd == "msg" || cmd == "m") {
        std::string peer_id;
        iss >> peer_id;
        cmd_send(peer_id, rest_of_line(iss));
    } else if (cmd == "cmd") {
        std::string peer_id;
        std::string command;
        iss >> peer_id >> command;
        cmd_command(peer_id, command, rest_of_line(iss));
    } else if (cmd == "file" || cmd == "f") {
        std::string peer_id;
        iss >> peer_id;
        cmd_file(peer_id, rest_of_line(iss));
    } else if (cmd == "broadcast" || cmd == "bc") {
        cmd_broadcast(rest_of_line(iss));
    } else if (cmd == "scan") {
        cmd_scan();
    } else if (cmd == "status" || cmd == "stat" || cmd == "s") {
        cmd_status();
    } else if (!cmd.empty()) {
        print_line(C_YELLOW "Unknown: " + cmd + " (type 'help')" C_RESET);
    }
}

void TerminalCLI::cmd_help() {
    print_lines({
        C_CYAN "═══════════ COMMANDS ═══════════" C_RESET,
        C_GREEN "help" C_RESET "                   Show this help",
        C_GREEN "peers" C_RESET "                  List known peers",
        C_GREEN "connect" C_RESET " id [ip]        Connect to peer",
        C_GREEN "disconnect" C_RESET " id          Close connection",
        C_GREEN "send" C_RESET " id text           Send text message",
        C_GREEN "cmd" C_RESET " id name [args]     Send command (PING, GET_INFO, ...)",
        C_GREEN "file" C_RESET " id path           Send a file",
        C_GREEN "broadcast" C_RESET " text         Send text to every connected peer",
        C_GREEN "scan" C_RESET "                   Run a discovery scan now",
        C_GREEN "status" C_RESET "                 Show status",
        C_RED "quit" C_RESET "                   Exit",
    });
}

void TerminalCLI::cmd_quit() {
    running = false;
}

void TerminalCLI::cmd_list_peers() {
    const std::vector<PeerDescriptor> peers = node.getPeers();
    std::vector<std::string> lines;
    lines.push_back(C_CYAN "Found: " + std::to_string(peers.size()) + " peer(s)" C_RESET);
    for (const auto& p : peers) {
        std::string line = p.peer_id + "  " + p.display_name;
        if (p.network_address) {
            line += "  " + *p.network_address;
        }
        line += "  [" + std::string(to_string(p.connection_state));
        if (p.connection_state == ConnectionState::FAILED && !p.failure_reason.empty()) {
            line += ": " + p.failure_reason;
        }
        line += "]";
        if (p.is_self) {
            line += " (self)";
        }
        lines.push_back(line);
    }
    print_lines(lines);
}

void TerminalCLI::cmd_connect(const std::string& peer_id, const std::string& ip) {
    if (peer_id.empty()) {
        print_line(C_YELLOW "Usage: connect <peer_id> [ip]" C_RESET);
        return;
    }

    std::string target = peer_id;
    if (ip.empty()) {
        std::vector<std::string> matches;
        target = resolve_peer_id(node.getPeers(), peer_id, &matches);
        if (target.empty()) {
            if (matches.empty()) {
                print_line(C_YELLOW "No match for: " + peer_id + " (give an ip to connect directly)" C_RESET);
            } else {
                print_line(C_YELLOW "Ambiguous peer id prefix, " + std::to_string(matches.size()) +
                           " matches" C_RESET);
            }
            return;
        }
    }

    print_line(C_DIM "Connecting to " + target + "..." C_RESET);
    std::string error;
    if (!node.connectToPeer(target, ip, &error)) {
        print_line(C_RED "Connect failed: " + error + C_RESET);
    }
}

void TerminalCLI::cmd_disconnect(const std::string& peer_id) {
    if (peer_id.empty()) {
        print_line(C_YELLOW "Usage: disconnect <peer_id>" C_RESET);
        return;
    }
    const std::string target = resolve_peer_id(node.getPeers(), peer_id, nullptr);
    node.disconnectPeer(target.empty() ? peer_id : target);
}

void TerminalCLI::cmd_send(const std::string& peer_id, const std::string& message) {
    if (peer_id.empty() || message.empty()) {
        print_line(C_YELLOW "Usage: send <peer_id> <message>" C_RESET);
        return;
    }
    const std::string target = resolve_peer_id(node.getPeers(), peer_id, nullptr);
    if (!node.sendMessageToPeer(target.empty() ? peer_id : target, message)) {
        print_line(C_RED "Not connected to " + peer_id + C_RESET);
    }
}

void TerminalCLI::cmd_command(const std::string& peer_id, const std::string& command, const std::string& args) {
    if (peer_id.empty() || command.empty()) {
        print_line(C_YELLOW "Usage: cmd <peer_id> <command> [args]" C_RESET);
        return;
    }
    std::string name = command;
    std::transform(name.begin(), name.end(), name.begin(), ::toupper);
    const std::string target = resolve_peer_id(node.getPeers(), peer_id, nullptr);
    if (!node.sendCommandToPeer(target.empty() ? peer_id : target, name, args)) {
        print_line(C_RED "Not connected to " + peer_id + C_RESET);
    }
}

void TerminalCLI::cmd_file(const std::string& peer_id, const std::string& path) {
    if (peer_id.empty() || path.empty()) {
        print_line(C_YELLOW "Usage: file <peer_id> <path>" C_RESET);
        return;
    }
    const std::string target = resolve_peer_id(node.getPeers(), peer_id, nullptr);
    std::string error;
    if (!node.sendFileToPeer(target.empty() ? peer_id : target, path, &error)) {
        print_line(C_RED "File send failed: " + error + C_RESET);
        return;
    }
    print_line(C_DIM "Sending " + path + " in the background" C_RESET);
}

void TerminalCLI::cmd_broadcast(const std::string& message) {
    if (message.empty()) {
        print_line(C_YELLOW "Usage: broadcast <message>" C_RESET);
        return;
    }
    const size_t sent = node.broadcastMessage(message);
    print_line(C_DIM "Broadcast queued on " + std::to_string(sent) + " connection(s)" C_RESET);
}

void TerminalCLI::cmd_scan() {
    print_line(C_DIM "Scanning..." C_RESET);
    const size_t found = node.scanNow();
    print_line(C_DIM "Scan found " + std::to_string(found) + " device(s)" C_RESET);
}

void TerminalCLI::cmd_status() {
    std::vector<std::string> lines;
    lines.push_back(C_CYAN "═══════════ STATUS ═══════════" C_RESET);
    for (const auto& line : node.getStatusLines()) {
        lines.push_back(line);
    }
    print_lines(lines);
}
