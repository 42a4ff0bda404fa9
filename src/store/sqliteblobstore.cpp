#include "store/sqliteblobstore.hpp"
#include "core/log.hpp"
#include <sqlite3.h>
#include <chrono>
#include <mutex>

namespace capshare::store {

namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS blobs (
            ref TEXT PRIMARY KEY,
            size INTEGER NOT NULL,
            data BLOB NOT NULL,
            created INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    const char* INSERT_BLOB =
        "INSERT OR IGNORE INTO blobs (ref, size, data, created) VALUES (?, ?, ?, ?)";
    const char* SELECT_BLOB = "SELECT data FROM blobs WHERE ref = ?";
    const char* EXISTS_BLOB = "SELECT 1 FROM blobs WHERE ref = ?";
    const char* COUNT_BLOBS = "SELECT COUNT(*) FROM blobs";
    const char* SET_META = "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)";
    const char* GET_META = "SELECT value FROM meta WHERE key = ?";
}

namespace {

constexpr const char* IDENTITY_KEY = "server_identity";

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* text) {
        if (sqlite3_prepare_v2(db, text, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("Failed to prepare statement: ") +
                             sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

void checkBind(sqlite3* db, int rc) {
    if (rc != SQLITE_OK) {
        throw StoreError(std::string("Failed to bind statement parameter: ") +
                         sqlite3_errmsg(db));
    }
}

} // anonymous namespace

class SqliteBlobStore::Impl {
public:
    Impl(const std::string& dbPath, std::string shareRoot)
        : shareRoot_(std::move(shareRoot)), db_(nullptr) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(dbPath.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            db_ = nullptr;
            throw StoreError("Failed to open blob database " + dbPath + ": " + error);
        }
        initializeDatabase();
        log::get("store")->debug("opened blob store {}", dbPath);
    }

    ~Impl() {
        if (db_) sqlite3_close(db_);
    }

    core::BlobRef upload(const core::Blob& blob) {
        if (!blob.ref().valid() || !blob.verify()) {
            throw StoreError("blob content does not match ref " + blob.ref().str());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::INSERT_BLOB);
        const auto& ref = blob.ref().str();
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        checkBind(db_, sqlite3_bind_text(stmt.get(), 1, ref.c_str(), -1, SQLITE_STATIC));
        checkBind(db_, sqlite3_bind_int64(stmt.get(), 2,
                                          static_cast<sqlite3_int64>(blob.size())));
        if (blob.size() == 0) {
            checkBind(db_, sqlite3_bind_zeroblob(stmt.get(), 3, 0));
        } else {
            checkBind(db_, sqlite3_bind_blob64(stmt.get(), 3, blob.data().data(),
                                               static_cast<sqlite3_uint64>(blob.size()),
                                               SQLITE_STATIC));
        }
        checkBind(db_, sqlite3_bind_int64(stmt.get(), 4, now));

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StoreError("Failed to store blob " + ref + ": " + sqlite3_errmsg(db_));
        }
        if (sqlite3_changes(db_) == 0) {
            log::get("store")->debug("blob {} already present", ref);
        }
        return blob.ref();
    }

    core::BlobRef serverIdentityRef() {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::GET_META);
        checkBind(db_, sqlite3_bind_text(stmt.get(), 1, IDENTITY_KEY, -1, SQLITE_STATIC));

        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StoreError("server has no signing identity");
        }
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        auto ref = core::BlobRef::parse(text ? text : "");
        if (!ref) {
            throw StoreError("stored server identity is not a valid ref");
        }
        return *ref;
    }

    std::string shareRoot() const {
        if (shareRoot_.empty()) {
            throw StoreError("server has no share handler");
        }
        return shareRoot_;
    }

    core::BlobRef setServerIdentity(const core::Blob& publicKeyBlob) {
        auto ref = upload(publicKeyBlob);

        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::SET_META);
        checkBind(db_, sqlite3_bind_text(stmt.get(), 1, IDENTITY_KEY, -1, SQLITE_STATIC));
        checkBind(db_, sqlite3_bind_text(stmt.get(), 2, ref.str().c_str(), -1,
                                         SQLITE_TRANSIENT));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StoreError(std::string("Failed to record server identity: ") +
                             sqlite3_errmsg(db_));
        }
        return ref;
    }

    std::optional<core::Blob> fetch(const core::BlobRef& ref) const {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::SELECT_BLOB);
        checkBind(db_, sqlite3_bind_text(stmt.get(), 1, ref.str().c_str(), -1,
                                         SQLITE_TRANSIENT));

        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        const void* data = sqlite3_column_blob(stmt.get(), 0);
        int size = sqlite3_column_bytes(stmt.get(), 0);
        std::vector<uint8_t> bytes;
        if (data && size > 0) {
            bytes.assign(static_cast<const uint8_t*>(data),
                         static_cast<const uint8_t*>(data) + size);
        }
        return core::Blob(ref, std::move(bytes));
    }

    bool contains(const core::BlobRef& ref) const {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::EXISTS_BLOB);
        checkBind(db_, sqlite3_bind_text(stmt.get(), 1, ref.str().c_str(), -1,
                                         SQLITE_TRANSIENT));
        return sqlite3_step(stmt.get()) == SQLITE_ROW;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, sql::COUNT_BLOBS);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StoreError(std::string("Failed to count blobs: ") + sqlite3_errmsg(db_));
        }
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

private:
    void initializeDatabase() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql::CREATE_TABLES, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw StoreError("Failed to initialize blob database: " + error);
        }
    }

    std::string shareRoot_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

SqliteBlobStore::SqliteBlobStore(const std::string& dbPath, std::string shareRoot)
    : impl_(std::make_unique<Impl>(dbPath, std::move(shareRoot))) {}

SqliteBlobStore::~SqliteBlobStore() = default;

core::BlobRef SqliteBlobStore::upload(const core::Blob& blob) {
    return impl_->upload(blob);
}

core::BlobRef SqliteBlobStore::serverIdentityRef() {
    return impl_->serverIdentityRef();
}

std::string SqliteBlobStore::shareRoot() {
    return impl_->shareRoot();
}

core::BlobRef SqliteBlobStore::setServerIdentity(const core::Blob& publicKeyBlob) {
    return impl_->setServerIdentity(publicKeyBlob);
}

std::optional<core::Blob> SqliteBlobStore::fetch(const core::BlobRef& ref) const {
    return impl_->fetch(ref);
}

bool SqliteBlobStore::contains(const core::BlobRef& ref) const {
    return impl_->contains(ref);
}

size_t SqliteBlobStore::count() const {
    return impl_->count();
}

} // namespace capshare::store
