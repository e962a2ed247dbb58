#include "../include/ean13/code_store.hpp"
#include "../include/ean13/errors.hpp"
#include "../include/ean13/logger.hpp"

#include <chrono>
#include <format>

namespace EAN13 {
    namespace {
        constexpr std::string_view SCHEMA {
            "CREATE TABLE IF NOT EXISTS codes ("
            "  code       TEXT PRIMARY KEY,"
            "  created_at INTEGER NOT NULL"
            ");"
        };

        std::int64_t secondsSinceEpoch() {
            auto tse {std::chrono::system_clock::now().time_since_epoch()};
            return std::chrono::duration_cast<std::chrono::seconds>(tse).count();
        }
    }

    std::expected<void, std::string> CodeStore::exec(std::string_view sql) {
        char *emsg {};
        if (sqlite3_exec(handle.get(), std::string{sql}.c_str(), nullptr, nullptr, &emsg) != SQLITE_OK) {
            std::string emsgStr = emsg? emsg: "unknown sqlite error";
            sqlite3_free(emsg);
            return std::unexpected{emsgStr};
        }
        return {};
    }

    std::expected<CodeStore::stmt_handle, std::string> CodeStore::prepare(std::string_view sql) {
        sqlite3_stmt *stmt {};
        if (sqlite3_prepare_v2(handle.get(), sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK)
            return std::unexpected{std::string{sqlite3_errmsg(handle.get())}};
        return stmt_handle{stmt, sqlite3_finalize};
    }

    CodeStore CodeStore::open(const std::string &path) {
        sqlite3 *raw {};
        if (sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
            std::string emsg {raw? sqlite3_errmsg(raw): "sqlite3_open failed"};
            if (raw) sqlite3_close(raw);
            throw StoreError(std::format("Unable to open code store '{}': {}", path, emsg));
        }

        CodeStore store;
        store.handle.reset(raw);
        store.path = path;
        if (auto res {store.exec(SCHEMA)}; !res)
            throw StoreError(std::format("Unable to create schema in '{}': {}", path, res.error()));

        Logging::Dynamic::Debug("Opened code store '{}'", path);
        return store;
    }

    bool CodeStore::insert(const Identifier &id) {
        auto stmt {prepare("INSERT OR IGNORE INTO codes (code, created_at) VALUES (?1, ?2);")};
        if (!stmt) throw StoreError(stmt.error());

        const std::string &code {id.str()};
        sqlite3_stmt *raw {stmt->get()};
        if (sqlite3_bind_text(raw, 1, code.c_str(), static_cast<int>(code.size()), SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_int64(raw, 2, secondsSinceEpoch()) != SQLITE_OK)
            throw StoreError(sqlite3_errmsg(handle.get()));

        if (sqlite3_step(raw) != SQLITE_DONE)
            throw StoreError(std::format("Unable to insert {}: {}", code, sqlite3_errmsg(handle.get())));

        bool inserted {sqlite3_changes(handle.get()) > 0};
        Logging::Dynamic::Debug("Code {} {}", code, inserted? "stored": "already present");
        return inserted;
    }

    std::size_t CodeStore::insert(const std::vector<Identifier> &ids) {
        if (auto res {exec("BEGIN;")}; !res) throw StoreError(res.error());

        std::size_t inserted {0};
        try {
            for (const Identifier &id: ids)
                inserted += insert(id)? 1: 0;
        } catch (const StoreError &) {
            if (auto res {exec("ROLLBACK;")}; !res)
                Logging::Dynamic::Error("Rollback failed: {}", res.error());
            throw;
        }

        if (auto res {exec("COMMIT;")}; !res) throw StoreError(res.error());
        return inserted;
    }

    bool CodeStore::contains(const Identifier &id) {
        return !selectCodes("SELECT code FROM codes WHERE code = ?1;", id.str()).empty();
    }

    std::size_t CodeStore::count() {
        auto stmt {prepare("SELECT COUNT(*) FROM codes;")};
        if (!stmt) throw StoreError(stmt.error());
        if (sqlite3_step(stmt->get()) != SQLITE_ROW)
            throw StoreError(sqlite3_errmsg(handle.get()));
        return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
    }

    std::vector<Identifier> CodeStore::withPrefix(std::string_view prefix) {
        if (prefix.empty()) return all();

        return selectCodes("SELECT code FROM codes WHERE substr(code, 1, length(?1)) = ?1 ORDER BY code;", prefix);
    }

    std::vector<Identifier> CodeStore::all() {
        return selectCodes("SELECT code FROM codes ORDER BY code;");
    }

    std::vector<Identifier> CodeStore::selectCodes(std::string_view sql, std::string_view bind) {
        auto stmt {prepare(sql)};
        if (!stmt) throw StoreError(stmt.error());

        sqlite3_stmt *raw {stmt->get()};
        if (sqlite3_bind_parameter_count(raw) > 0 &&
            sqlite3_bind_text(raw, 1, bind.data(), static_cast<int>(bind.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            throw StoreError(sqlite3_errmsg(handle.get()));

        std::vector<Identifier> result; int rc;
        while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
            const auto *txt {reinterpret_cast<const char*>(sqlite3_column_text(raw, 0))};
            std::string_view code {txt? txt: "", static_cast<std::size_t>(sqlite3_column_bytes(raw, 0))};
            try {
                result.push_back(Identifier::from(code));
            } catch (const ValidationError &ex) {
                throw StoreError(std::format("Corrupt row '{}' in '{}': {}", code, path, ex.what()));
            }
        }

        if (rc != SQLITE_DONE) throw StoreError(sqlite3_errmsg(handle.get()));
        return result;
    }

    std::vector<EncodedCode> issue(CodeStore &store, CodeGenerator &generator, std::string_view prefix, std::size_t count) {
        std::vector<EncodedCode> codes {generator.generateBatch(prefix, store.withPrefix(prefix), count)};

        std::vector<Identifier> ids; ids.reserve(codes.size());
        for (const EncodedCode &code: codes) ids.push_back(code.identifier());
        std::size_t stored {store.insert(ids)};

        Logging::Dynamic::Info("Issued {} codes with prefix '{}' into '{}'", stored, prefix, store.location());
        return codes;
    }
}
