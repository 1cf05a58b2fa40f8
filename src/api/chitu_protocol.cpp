// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chitu_protocol.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace chitusync {

namespace {

constexpr const char* JOB_EXTENSIONS[] = {".ctb", ".goo"};

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

std::string first_token(const std::string& line) {
    size_t end = line.find_first_of(" \t");
    return line.substr(0, end);
}

std::vector<std::string> split_tokens(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    errno = 0;
    char* endptr = nullptr;
    unsigned long long val = std::strtoull(text.c_str(), &endptr, 10);
    if (errno != 0 || *endptr != '\0') {
        return false;
    }
    out = static_cast<uint64_t>(val);
    return true;
}

/// Parse "<read>/<total>" following the word "byte"
bool parse_byte_position(const std::string& line, uint64_t& read, uint64_t& total) {
    auto tokens = split_tokens(line);
    for (size_t i = 0; i + 1 < tokens.size(); i++) {
        if (to_lower(tokens[i]) != "byte") {
            continue;
        }
        const std::string& pos = tokens[i + 1];
        size_t slash = pos.find('/');
        if (slash == std::string::npos) {
            return false;
        }
        return parse_u64(pos.substr(0, slash), read) && parse_u64(pos.substr(slash + 1), total);
    }
    return false;
}

/// Remove a leading "ok" token from lines like "ok SD printing byte 1/2"
std::string strip_ok_prefix(const std::string& line) {
    if (first_token(line) == "ok") {
        return trim(line.substr(2));
    }
    return line;
}

BoardCommand make_command(const std::string& name, const std::string& payload,
                          ReplyShape shape = ReplyShape::UNTIL_OK) {
    BoardCommand cmd;
    cmd.name = name;
    cmd.payload = payload;
    cmd.shape = shape;
    return cmd;
}

} // namespace

bool ChituProtocol::is_job_file(const std::string& name) const {
    std::string lower = to_lower(name);
    for (const char* ext : JOB_EXTENSIONS) {
        std::string e(ext);
        if (lower.size() > e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0) {
            return true;
        }
    }
    return false;
}

BoardCommand ChituProtocol::identify() const {
    return make_command("M99999", "M99999");
}

BoardCommand ChituProtocol::list_files() const {
    return make_command("M20", "M20", ReplyShape::FILE_LIST);
}

BoardCommand ChituProtocol::begin_upload(const std::string& remote_name) const {
    return make_command("M28", "M28 " + remote_name);
}

BoardCommand ChituProtocol::upload_chunk(const uint8_t* data, size_t len, uint32_t offset) const {
    std::string payload;
    payload.reserve(len + 6);
    payload.append(reinterpret_cast<const char*>(data), len);
    for (int i = 0; i < 4; i++) {
        payload.push_back(static_cast<char>((offset >> (8 * i)) & 0xFF));
    }
    payload.push_back(static_cast<char>(chunk_checksum(data, len, offset)));
    payload.push_back(static_cast<char>(CHUNK_TERMINATOR));
    return make_command("CHUNK", payload, ReplyShape::CHUNK_ACK);
}

BoardCommand ChituProtocol::verify_upload(uint64_t total_bytes) const {
    return make_command("M4012", "M4012 I1 T" + std::to_string(total_bytes));
}

BoardCommand ChituProtocol::end_upload() const {
    return make_command("M29", "M29");
}

BoardCommand ChituProtocol::delete_file(const std::string& remote_name) const {
    return make_command("M30", "M30 " + remote_name);
}

BoardCommand ChituProtocol::start_print(const std::string& remote_name) const {
    return make_command("M6030", "M6030 '" + remote_name + "'");
}

BoardCommand ChituProtocol::stop_print() const {
    return make_command("M33", "M33");
}

BoardCommand ChituProtocol::query_status() const {
    return make_command("M27", "M27");
}

BoardCommand ChituProtocol::home_z() const {
    return make_command("G28", "G28 Z");
}

BoardCommand ChituProtocol::query_position() const {
    return make_command("M114", "M114");
}

BoardCommand ChituProtocol::move_z(double z_mm) const {
    return make_command("G0", fmt::format("G0 Z{:.3f}", z_mm));
}

ReplyProgress ChituProtocol::accept_line(const BoardCommand& command, const std::string& line,
                                         BoardReply& reply) const {
    std::string text = trim(line);
    if (text.empty()) {
        return ReplyProgress::NEED_MORE;
    }
    std::string token = first_token(text);

    switch (command.shape) {
    case ReplyShape::UNTIL_OK:
        reply.lines.push_back(text);
        reply.bytes += line.size();
        return token == "ok" ? ReplyProgress::COMPLETE : ReplyProgress::NEED_MORE;

    case ReplyShape::FILE_LIST: {
        bool list_ended =
            std::find(reply.lines.begin(), reply.lines.end(), "End file list") != reply.lines.end();
        reply.lines.push_back(text);
        reply.bytes += line.size();
        return (list_ended && token == "ok") ? ReplyProgress::COMPLETE : ReplyProgress::NEED_MORE;
    }

    case ReplyShape::CHUNK_ACK:
        if (token == "ok" || token == "resend") {
            reply.lines.push_back(text);
            reply.bytes += line.size();
            return ReplyProgress::COMPLETE;
        }
        return ReplyProgress::DISCARD;
    }
    return ReplyProgress::DISCARD;
}

ChituError ChituProtocol::parse_board_info(const BoardReply& reply, BoardInfo& info) const {
    // ok MAC:00:e0:4c:27:00:2e IP:192.168.1.174 VER:V1.4.1 ID:2e,00,27,00 NAME:CBD
    for (const auto& line : reply.lines) {
        auto tokens = split_tokens(line);
        if (tokens.empty() || tokens[0] != "ok") {
            continue;
        }

        BoardInfo parsed;
        int fields = 0;
        for (size_t i = 1; i < tokens.size(); i++) {
            size_t colon = tokens[i].find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = tokens[i].substr(0, colon);
            std::string value = tokens[i].substr(colon + 1);
            if (key == "MAC") {
                parsed.mac = value;
            } else if (key == "IP") {
                parsed.ip = value;
            } else if (key == "VER") {
                parsed.version = value;
            } else if (key == "ID") {
                parsed.id = value;
            } else if (key == "NAME") {
                parsed.name = value;
            } else {
                continue;
            }
            fields++;
        }

        if (fields > 0) {
            info = parsed;
            return {};
        }
    }
    return ChituError::protocol_error(identify().name, "no identification fields in reply");
}

bool ChituProtocol::split_listing_line(const std::string& line, std::string& name,
                                       std::string& size_text) {
    std::string lower = to_lower(line);
    size_t best = std::string::npos;
    size_t best_len = 0;
    for (const char* ext : JOB_EXTENSIONS) {
        size_t pos = lower.rfind(ext);
        if (pos != std::string::npos && (best == std::string::npos || pos > best)) {
            best = pos;
            best_len = std::char_traits<char>::length(ext);
        }
    }
    if (best == std::string::npos) {
        return false;
    }
    name = line.substr(0, best + best_len);
    size_text = trim(line.substr(best + best_len));
    return true;
}

ChituError ChituProtocol::parse_file_list(const BoardReply& reply,
                                          RemoteSnapshot::Map& files) const {
    RemoteSnapshot::Map parsed;
    bool ended = false;

    for (const auto& line : reply.lines) {
        if (line == "End file list") {
            ended = true;
            break;
        }
        if (line == "Begin file list" || first_token(line) == "ok") {
            continue;
        }

        std::string name;
        std::string size_text;
        if (!split_listing_line(line, name, size_text)) {
            continue; // Not a job file
        }

        uint64_t size = 0;
        if (!parse_u64(size_text, size)) {
            return ChituError::protocol_error(list_files().name, "bad size in line '" + line + "'");
        }
        if (size == 0) {
            continue; // Deleted placeholder
        }
        parsed[name] = RemoteFileRecord{name, size};
    }

    if (!ended) {
        return ChituError::protocol_error(list_files().name, "listing not terminated");
    }
    files = std::move(parsed);
    return {};
}

ChituError ChituProtocol::parse_print_status(const BoardReply& reply,
                                             PrintJobStatus& status) const {
    const std::string cmd = query_status().name;

    for (const auto& raw : reply.lines) {
        std::string line = strip_ok_prefix(raw);
        if (line.empty()) {
            continue;
        }
        std::string lower = to_lower(line);

        PrintJobStatus parsed;
        if (lower.find("not sd printing") != std::string::npos) {
            parsed.state = PrintJobStatus::State::IDLE;
        } else if (lower.find("error") != std::string::npos) {
            parsed.state = PrintJobStatus::State::ERROR;
            parse_byte_position(line, parsed.bytes_read, parsed.total_bytes);
        } else if (lower.find("paused") != std::string::npos) {
            parsed.state = PrintJobStatus::State::PAUSED;
            parse_byte_position(line, parsed.bytes_read, parsed.total_bytes);
        } else if (lower.rfind("sd printing byte", 0) == 0) {
            parsed.state = PrintJobStatus::State::PRINTING;
            if (!parse_byte_position(line, parsed.bytes_read, parsed.total_bytes)) {
                return ChituError::protocol_error(cmd, "bad byte position in '" + line + "'");
            }
        } else {
            return ChituError::protocol_error(cmd, "unrecognized status '" + line + "'");
        }

        parsed.filename = status.filename;
        status = parsed;
        return {};
    }
    return ChituError::protocol_error(cmd, "empty status reply");
}

ChituError ChituProtocol::parse_z_position(const BoardReply& reply, double& z_mm) const {
    for (const auto& line : reply.lines) {
        for (const auto& token : split_tokens(line)) {
            if (token.size() <= 2 || token.compare(0, 2, "Z:") != 0) {
                continue;
            }
            std::string value = token.substr(2);
            char* endptr = nullptr;
            double z = std::strtod(value.c_str(), &endptr);
            if (*endptr != '\0') {
                return ChituError::protocol_error(query_position().name,
                                                  "bad Z value '" + value + "'");
            }
            z_mm = z;
            return {};
        }
    }
    return ChituError::protocol_error(query_position().name, "no Z position in reply");
}

bool ChituProtocol::is_rejection(const BoardReply& reply) const {
    for (const auto& line : reply.lines) {
        if (line.find("Error") != std::string::npos || line.find("Failed") != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool ChituProtocol::is_acknowledged(const BoardReply& reply) const {
    return !reply.lines.empty() && first_token(reply.first_line()) == "ok";
}

bool ChituProtocol::is_resend(const BoardReply& reply) const {
    return !reply.lines.empty() && first_token(reply.first_line()) == "resend";
}

uint8_t ChituProtocol::chunk_checksum(const uint8_t* data, size_t len, uint32_t offset) {
    uint8_t x = 0;
    for (size_t i = 0; i < len; i++) {
        x ^= data[i];
    }
    for (int i = 0; i < 4; i++) {
        x ^= static_cast<uint8_t>((offset >> (8 * i)) & 0xFF);
    }
    return x;
}

} // namespace chitusync
