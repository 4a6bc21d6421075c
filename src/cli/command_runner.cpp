/**
 * @file command_runner.cpp
 * @brief Реализация исполнителя команд
 */

#include "command_runner.hpp"
#include "../log/logger.hpp"
#include "../trees/proof_verifier.hpp"

#include <charconv>
#include <format>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace arbor::cli {

namespace {

constexpr std::string_view COMPONENT = "cli";

Result<core::Bytes32> parse_hex(std::string_view text) {
    try {
        return core::Bytes32::from_hex(text);
    } catch (const std::invalid_argument& e) {
        return Err<core::Bytes32>(
            ErrorCode::CommandParseError,
            std::format("Некорректное hex значение '{}': {}", text, e.what())
        );
    }
}

Result<uint64_t> parse_u64(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<uint64_t>(
            ErrorCode::CommandParseError,
            std::format("Некорректное число '{}'", text)
        );
    }
    return value;
}

Result<std::string> usage(std::string_view expected) {
    return Err<std::string>(
        ErrorCode::CommandParseError,
        std::format("Использование: {}", expected)
    );
}

std::string ok_root(const core::Bytes32& root) {
    return std::format("ok root={}", root.to_hex());
}

} // anonymous namespace

std::vector<std::string_view> tokenize(std::string_view line) {
    std::vector<std::string_view> tokens;
    constexpr std::string_view whitespace = " \t\r\n";

    std::size_t pos = 0;
    while (pos < line.size()) {
        pos = line.find_first_not_of(whitespace, pos);
        if (pos == std::string_view::npos) {
            break;
        }
        std::size_t end = line.find_first_of(whitespace, pos);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        tokens.push_back(line.substr(pos, end - pos));
        pos = end;
    }

    return tokens;
}

// =============================================================================
// CommandRunner
// =============================================================================

CommandRunner::CommandRunner(const Config& config)
    : config_(config) {}

Result<void> CommandRunner::init() {
    if (auto res = cartesian_.initialize(config_.cartesian.desired_proof_size); !res) {
        return res;
    }
    if (auto res = sparse_.initialize(config_.sparse.max_depth); !res) {
        return res;
    }
    if (auto res = indexed_.initialize(); !res) {
        return res;
    }
    return {};
}

Result<std::string> CommandRunner::execute(std::string_view line) {
    const Args args = tokenize(line);

    if (args.empty()) {
        return Err<std::string>(ErrorCode::CommandParseError, "Пустая команда");
    }

    if (args[0] == "cmt") {
        return execute_cartesian(args);
    }
    if (args[0] == "smt") {
        return execute_sparse(args);
    }
    if (args[0] == "imt") {
        return execute_indexed(args);
    }

    return Err<std::string>(
        ErrorCode::UnknownCommand,
        std::format("Неизвестное дерево '{}'", args[0])
    );
}

int CommandRunner::run(std::istream& in, std::ostream& out) {
    int exit_code = 0;
    std::string line;
    uint64_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;

        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        auto result = execute(line);
        if (result) {
            out << *result << '\n';
        } else {
            out << "error: " << result.error().message << '\n';
            log::warn(COMPONENT, std::format("Строка {}: {}", line_number, result.error().message));
            exit_code = 1;
        }
    }

    out.flush();
    return exit_code;
}

// =============================================================================
// cmt
// =============================================================================

Result<std::string> CommandRunner::execute_cartesian(const Args& args) {
    if (args.size() < 2) {
        return usage("cmt add|remove|proof <key> | cmt root|count");
    }

    const std::string_view op = args[1];

    if (op == "root" && args.size() == 2) {
        return cartesian_.get_root().to_hex();
    }
    if (op == "count" && args.size() == 2) {
        return std::to_string(cartesian_.get_nodes_count());
    }

    if (op != "add" && op != "remove" && op != "proof") {
        return Err<std::string>(ErrorCode::UnknownCommand,
                                std::format("Неизвестная команда 'cmt {}'", op));
    }
    if (args.size() != 3) {
        return usage(std::format("cmt {} <key>", op));
    }

    auto key = parse_hex(args[2]);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (op == "add") {
        auto res = cartesian_.add(*key);
        if (!res) {
            return std::unexpected(res.error());
        }
        return ok_root(cartesian_.get_root());
    }

    if (op == "remove") {
        auto res = cartesian_.remove(*key);
        if (!res) {
            return std::unexpected(res.error());
        }
        return ok_root(cartesian_.get_root());
    }

    auto proof = cartesian_.get_proof(*key);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    const bool verified = trees::verify_cartesian_proof(*proof, *cartesian_.get_hasher());

    std::string result = std::format("existence={} siblings={} verified={}",
                                     proof->existence, proof->siblings_length, verified);
    if (!proof->existence && proof->siblings_length != 0) {
        result += std::format(" non_existence_key={}", proof->non_existence_key.to_hex());
    }
    return result;
}

// =============================================================================
// smt
// =============================================================================

Result<std::string> CommandRunner::execute_sparse(const Args& args) {
    if (args.size() < 2) {
        return usage("smt add|update <index> <value> | smt proof <index> | smt root|count");
    }

    const std::string_view op = args[1];

    if (op == "root" && args.size() == 2) {
        return sparse_.get_root().to_hex();
    }
    if (op == "count" && args.size() == 2) {
        return std::to_string(sparse_.get_nodes_count());
    }

    if (op == "add" || op == "update") {
        if (args.size() != 4) {
            return usage(std::format("smt {} <index> <value>", op));
        }

        auto index = parse_hex(args[2]);
        if (!index) {
            return std::unexpected(index.error());
        }
        auto value = parse_hex(args[3]);
        if (!value) {
            return std::unexpected(value.error());
        }

        auto res = op == "add" ? sparse_.add(*index, *value) : sparse_.update(*index, *value);
        if (!res) {
            return std::unexpected(res.error());
        }
        return ok_root(sparse_.get_root());
    }

    if (op == "proof") {
        if (args.size() != 3) {
            return usage("smt proof <index>");
        }

        auto index = parse_hex(args[2]);
        if (!index) {
            return std::unexpected(index.error());
        }

        const trees::SparseProof proof = sparse_.get_proof(*index);
        const bool verified = trees::verify_sparse_proof(proof, *sparse_.get_hasher());

        std::string result = std::format("existence={} verified={}", proof.existence, verified);
        if (proof.existence) {
            result += std::format(" value={}", proof.value.to_hex());
        } else if (proof.aux_existence) {
            result += std::format(" aux_index={}", proof.aux_index.to_hex());
        }
        return result;
    }

    return Err<std::string>(ErrorCode::UnknownCommand,
                            std::format("Неизвестная команда 'smt {}'", op));
}

// =============================================================================
// imt
// =============================================================================

Result<std::string> CommandRunner::execute_indexed(const Args& args) {
    if (args.size() < 2) {
        return usage("imt add <value> [low] | imt proof <index> <value> | imt root|count");
    }

    const std::string_view op = args[1];

    if (op == "root" && args.size() == 2) {
        return indexed_.get_root().to_hex();
    }
    if (op == "count" && args.size() == 2) {
        return std::to_string(indexed_.get_leaves_count());
    }

    if (op == "add") {
        if (args.size() != 3 && args.size() != 4) {
            return usage("imt add <value> [low]");
        }

        auto value = parse_hex(args[2]);
        if (!value) {
            return std::unexpected(value.error());
        }

        // Без явного low leaf ищем его сами
        auto low = args.size() == 4 ? parse_u64(args[3]) : indexed_.find_low_leaf(*value);
        if (!low) {
            return std::unexpected(low.error());
        }

        auto index = indexed_.add(*value, *low);
        if (!index) {
            return std::unexpected(index.error());
        }
        return std::format("index={} root={}", *index, indexed_.get_root().to_hex());
    }

    if (op == "proof") {
        if (args.size() != 4) {
            return usage("imt proof <index> <value>");
        }

        auto index = parse_u64(args[2]);
        if (!index) {
            return std::unexpected(index.error());
        }
        auto value = parse_hex(args[3]);
        if (!value) {
            return std::unexpected(value.error());
        }

        auto proof = indexed_.get_proof(*index, *value);
        if (!proof) {
            return std::unexpected(proof.error());
        }

        return std::format("existence={} siblings={} verified={}",
                           proof->existence, proof->siblings.size(),
                           indexed_.verify_proof(*proof));
    }

    return Err<std::string>(ErrorCode::UnknownCommand,
                            std::format("Неизвестная команда 'imt {}'", op));
}

} // namespace arbor::cli
