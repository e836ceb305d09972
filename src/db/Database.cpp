#include "Database.hpp"

#include <sqlite3.h>

#include <utility>

namespace trafficsim::db
{
    namespace
    {
        sqlite3 *openDatabase(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = handle ? sqlite3_errmsg(handle) : "failed to open database";
                }
                sqlite3_close(handle);
                return nullptr;
            }
            return handle;
        }

        void setError(sqlite3 *handle, std::string *error)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
        }
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
        sqlite3 *handle = openDatabase(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS episode_results ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "policy TEXT NOT NULL,"
            "episode INTEGER NOT NULL,"
            "wait_time REAL NOT NULL,"
            "collided INTEGER NOT NULL"
            ");";

        char *errmsg = nullptr;
        const int exec_rc = sqlite3_exec(handle, create_sql, nullptr, nullptr, &errmsg);
        if (exec_rc != SQLITE_OK)
        {
            if (error)
            {
                *error = errmsg ? errmsg : "failed to initialize schema";
            }
            sqlite3_free(errmsg);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
    }

    bool Database::saveActiveNetworkConfigJson(const std::string &config_json, std::string *error) const
    {
        sqlite3 *handle = openDatabase(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO app_config(key, value) VALUES('active_network_config', ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_text(stmt, 1, config_json.c_str(), static_cast<int>(config_json.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (step_rc != SQLITE_DONE)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
    }

    std::optional<std::string> Database::loadActiveNetworkConfigJson(std::string *error) const
    {
        sqlite3 *handle = openDatabase(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        const char *select_sql = "SELECT value FROM app_config WHERE key = 'active_network_config' LIMIT 1;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return std::nullopt;
        }

        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            std::string value = text ? reinterpret_cast<const char *>(text) : "";
            sqlite3_finalize(stmt);
            sqlite3_close(handle);
            return value;
        }

        if (step_rc != SQLITE_DONE)
        {
            setError(handle, error);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return std::nullopt;
    }

    bool Database::saveEpisodeResult(const StoredEpisodeResult &result, std::string *error) const
    {
        sqlite3 *handle = openDatabase(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *insert_sql =
            "INSERT INTO episode_results(policy, episode, wait_time, collided) VALUES(?, ?, ?, ?);";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, insert_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_text(stmt, 1, result.policy.c_str(), static_cast<int>(result.policy.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(result.episode));
        sqlite3_bind_double(stmt, 3, result.wait_time);
        sqlite3_bind_int(stmt, 4, result.collided ? 1 : 0);

        const int step_rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (step_rc != SQLITE_DONE)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
    }

    std::vector<StoredEpisodeResult> Database::loadEpisodeResults(const std::string &policy, std::string *error) const
    {
        std::vector<StoredEpisodeResult> results;
        sqlite3 *handle = openDatabase(file_path, error);
        if (!handle)
        {
            return results;
        }

        const char *select_sql =
            "SELECT policy, episode, wait_time, collided FROM episode_results WHERE policy = ? ORDER BY id;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            setError(handle, error);
            sqlite3_close(handle);
            return results;
        }

        sqlite3_bind_text(stmt, 1, policy.c_str(), static_cast<int>(policy.size()), SQLITE_TRANSIENT);

        int step_rc = sqlite3_step(stmt);
        while (step_rc == SQLITE_ROW)
        {
            StoredEpisodeResult row;
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            row.policy = text ? reinterpret_cast<const char *>(text) : "";
            row.episode = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
            row.wait_time = sqlite3_column_double(stmt, 2);
            row.collided = sqlite3_column_int(stmt, 3) != 0;
            results.push_back(row);
            step_rc = sqlite3_step(stmt);
        }

        if (step_rc != SQLITE_DONE)
        {
            setError(handle, error);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return results;
    }
} // namespace trafficsim::db
