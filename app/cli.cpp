#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <respkv/net/connection.hpp>
#include <respkv/proto/frame.hpp>

using asio::ip::tcp;
using namespace respkv;

// ---------- simple tokenizer: splits like a shell (supports "quoted strings")
static std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool inq = false, have = false;
    char q = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (!inq && std::isspace(static_cast<unsigned char>(c))) {
            if (have) { out.push_back(cur); cur.clear(); have = false; }
            continue;
        }
        have = true;
        if (!inq && (c == '"' || c == '\'')) { inq = true; q = c; continue; }
        if (inq && c == q) { inq = false; continue; }
        if (inq && c == '\\' && i + 1 < line.size()) {
            char n = line[++i];
            switch (n) {
            case 'n': cur.push_back('\n'); break;
            case 'r': cur.push_back('\r'); break;
            case 't': cur.push_back('\t'); break;
            default: cur.push_back(n); break;
            }
            continue;
        }
        cur.push_back(c);
    }
    if (have) out.push_back(cur);
    return out;
}

static Frame to_request(const std::vector<std::string>& args) {
    std::vector<Frame> items;
    items.reserve(args.size());
    for (auto& a : args) items.push_back(Frame::bulk(a));
    return Frame::array_of(std::move(items));
}

static void print_frame(const Frame& v, const std::string& indent = "") {
    switch (v.type) {
    case Frame::Type::Simple:  std::cout << v.str << "\n"; break;
    case Frame::Type::Error:   std::cout << "(error) " << v.str << "\n"; break;
    case Frame::Type::Integer: std::cout << "(integer) " << v.integer << "\n"; break;
    case Frame::Type::Bulk:    std::cout << "\"" << v.str << "\"\n"; break;
    case Frame::Type::Null:    std::cout << "(nil)\n"; break;
    case Frame::Type::Array:
        if (v.array.empty()) { std::cout << "(empty array)\n"; break; }
        for (size_t i = 0; i < v.array.size(); ++i) {
            if (i) std::cout << indent;
            std::cout << i + 1 << ") ";
            print_frame(v.array[i], indent + "   ");
        }
        break;
    }
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    std::uint16_t port = 6379;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-h" || a == "--host") && i + 1 < argc) { host = argv[++i]; }
        else if ((a == "-p" || a == "--port") && i + 1 < argc) { port = static_cast<std::uint16_t>(std::stoi(argv[++i])); }
        else if (a == "-?" || a == "--help") {
            std::cout << "Usage: respkv-cli [-h host] [-p port]\n"; return 0;
        }
    }

    try {
        asio::io_context io;
        tcp::resolver res(io);
        tcp::socket sock(io);
        asio::connect(sock, res.resolve(host, std::to_string(port)));
        Connection<tcp::socket> conn(std::move(sock));

        std::cout << "Connected to " << host << ":" << port << "\n";
        std::cout << "Type commands like:  PING  |  SET a \"hello\" EX 10  |  GET a\n";

        for (;;) {
            std::cout << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) break;
            auto args = tokenize(line);
            if (args.empty()) continue;
            if (args.size() == 1 && (args[0] == "QUIT" || args[0] == "quit")) break;

            conn.write_frame(to_request(args));
            auto reply = conn.read_frame();
            if (!reply) {
                std::cout << "(connection closed by server)\n"; break;
            }
            print_frame(*reply);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
