#pragma once

#include "code_generator.hpp"
#include "identifier.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace EAN13 {
    // Identifiers already issued, persisted in SQLite
    class CodeStore {
        private:
            using db_handle = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
            using stmt_handle = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

            db_handle handle {nullptr, sqlite3_close};
            std::string path;

            CodeStore() = default;

            std::expected<void, std::string> exec(std::string_view sql);
            std::expected<stmt_handle, std::string> prepare(std::string_view sql);

            // Runs a SELECT returning codes in column 0 and validates each row
            std::vector<Identifier> selectCodes(std::string_view sql, std::string_view bind = {});

        public:
            // Opens (or creates) the database and its schema, ":memory:" is accepted
            [[nodiscard]] static CodeStore open(const std::string &path);

            // False if the identifier was already stored
            bool insert(const Identifier &id);

            // All or nothing insert of a batch, returns how many were new
            std::size_t insert(const std::vector<Identifier> &ids);

            [[nodiscard]] bool contains(const Identifier &id);
            [[nodiscard]] std::size_t count();

            // Identifiers starting with `prefix`, in code order
            [[nodiscard]] std::vector<Identifier> withPrefix(std::string_view prefix);
            [[nodiscard]] std::vector<Identifier> all();

            const std::string &location() const { return path; }
    };

    // Generate `count` codes that are free in the store and record them in one transaction
    [[nodiscard]] std::vector<EncodedCode> issue(CodeStore &store, CodeGenerator &generator,
        std::string_view prefix, std::size_t count);
}
