/**
 * @file arg_parser.hpp
 * @brief mrngen ArgParser — heap-free tokenizer for `-key value` request lines.
 *
 * Batch files hold one request per line written with the same short keys the
 * command line uses:
 *
 * ```
 * -c DK -n 3 -p B1 -C A -o 004700
 * ```
 *
 * The parser splits such a line into:
 *
 * - **Key-value pairs** (`-c DK`, `--declaration-office 004700`)
 * - **Standalone flags** (a key followed by another key or end of line)
 *
 * It knows nothing about MRNs; request_line.hpp maps keys onto a
 * `GenerationRequest`.
 *
 * ---
 *
 * @section mrngen_argparser_rules Format Rules
 *
 * - Tokens are separated by spaces or tabs; runs of whitespace are tolerated.
 * - A token starting with `-` is a key. Single and double dashes are both kept
 *   verbatim (`-c` and `--country-code` are different keys here).
 * - A key followed by a non-dash token takes it as its value; otherwise it is a flag.
 * - A repeated key keeps the last value.
 * - A bare value with no key in front of it is a stray token.
 * - Quoting and escaping are not supported.
 *
 * ---
 *
 * @section mrngen_argparser_design Design Constraints
 *
 * - Fixed ETL containers only; no heap, no exceptions.
 * - Up to **16 tokens**, 12 key-value pairs and 8 flags.
 * - Anything beyond those limits, an over-long token, or a stray value sets
 *   `overflowed()` / `stray()` so callers can reject the line rather than act
 *   on part of it.
 */

#ifndef MRNGEN_ARG_PARSER_HPP
#define MRNGEN_ARG_PARSER_HPP

#include "etl/string.h"
#include "etl/vector.h"
#include "etl/map.h"
#include <stdint.h>
#include <stddef.h>

namespace mrngen {

class ArgParser {
public:
    /** @brief Maximum size (in characters) of any key or value. */
    static constexpr size_t TOKEN_SIZE  = 32;

    /** @brief Maximum number of standalone flags accepted per line. */
    static constexpr size_t MAX_FLAGS   = 8;

    /** @brief Maximum number of key-value pairs per line. */
    static constexpr size_t MAX_ARGS    = 12;

    /** @brief Maximum number of whitespace-separated tokens per line. */
    static constexpr size_t MAX_TOKENS  = 16;

    using token_t     = etl::string<TOKEN_SIZE>;
    using flag_list_t = etl::vector<token_t, MAX_FLAGS>;
    using arg_map_t   = etl::map<token_t, token_t, MAX_ARGS>;

    /**
     * @brief Construct and parse a NUL-terminated line.
     * @param line Input text; nullptr is treated as an empty line.
     */
    explicit ArgParser(const char* line) {
        parse(line);
    }

    const flag_list_t& flags() const { return m_flags; }

    const arg_map_t& arguments() const { return m_args; }

    /**
     * @brief Check if a standalone flag was provided.
     * @param flag Key string (e.g. "-v").
     */
    bool has_flag(const token_t& flag) const {
        for (size_t i = 0; i < m_flags.size(); ++i) {
            if (m_flags[i] == flag) return true;
        }
        return false;
    }

    /** @brief Check if a key-value argument exists. */
    bool has_argument(const token_t& key) const {
        return m_args.find(key) != m_args.end();
    }

    /**
     * @brief Retrieve a value for a key.
     * @return Reference to the value (empty if not found).
     */
    const token_t& get_argument(const token_t& key) const {
        auto it = m_args.find(key);
        return (it != m_args.end()) ? it->second : m_empty;
    }

    /** @brief true if the line had nothing but whitespace. */
    bool empty() const { return m_token_count == 0; }

    /** @brief true if any limit (token count, token size, pairs, flags) was exceeded. */
    bool overflowed() const { return m_overflow; }

    /** @brief true if a value appeared with no key before it. */
    bool stray() const { return m_stray; }

private:
    flag_list_t m_flags;
    arg_map_t   m_args;
    token_t     m_empty;  ///< Returned for missing lookups
    size_t      m_token_count = 0;
    bool        m_overflow = false;
    bool        m_stray = false;

    static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

    void parse(const char* line) {
        if (!line) return;

        // ----------------------------------------------
        // Phase 1: Tokenization (whitespace-separated)
        // ----------------------------------------------
        etl::vector<token_t, MAX_TOKENS> tokens;
        token_t tok;
        const char* p = line;

        while (true) {
            tok.clear();

            while (*p && is_space(*p)) ++p;
            if (*p == 0) break;

            while (*p && !is_space(*p)) {
                if (tok.size() < TOKEN_SIZE) tok.push_back(*p);
                else                         m_overflow = true;
                ++p;
            }

            ++m_token_count;
            if (tokens.size() < MAX_TOKENS) tokens.push_back(tok);
            else                            m_overflow = true;
        }

        // ----------------------------------------------
        // Phase 2: Keys, values and flags
        // ----------------------------------------------
        size_t idx = 0;
        while (idx < tokens.size()) {
            const token_t& key = tokens[idx];

            if (key[0] != '-') {
                m_stray = true;
                idx++;
                continue;
            }

            if (idx + 1 < tokens.size() && tokens[idx + 1][0] != '-') {
                auto it = m_args.find(key);
                if (it != m_args.end()) {
                    it->second = tokens[idx + 1];
                } else if (!m_args.full()) {
                    m_args.insert(arg_map_t::value_type(key, tokens[idx + 1]));
                } else {
                    m_overflow = true;
                }
                idx += 2;
            } else {
                if (!has_flag(key)) {
                    if (m_flags.size() < MAX_FLAGS) m_flags.push_back(key);
                    else                            m_overflow = true;
                }
                idx++;
            }
        }
    }
};

} // namespace mrngen

#endif // MRNGEN_ARG_PARSER_HPP
