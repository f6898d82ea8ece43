#pragma once
#include "errors.hpp"
#include <filesystem>
#include <string_view>

struct MDB_env;
struct MDB_txn;
struct MDB_cursor;
struct MDB_val;
using DbHandle = unsigned int;

namespace quasar
{

  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;
    Txn(Txn &&other) noexcept;
    Txn &operator=(Txn &&other) noexcept;

    MDB_txn *get() const;
    bool writable() const { return rw_; }
    void commit();
    void abort() noexcept;

  private:
    MDB_env *env_{};
    MDB_txn *txn_{};
    bool rw_{};
  };

  // Cursor over one table. Must not outlive its transaction.
  class Cursor
  {
  public:
    Cursor(const Txn &tx, DbHandle dbi);
    ~Cursor() noexcept;
    Cursor(const Cursor &) = delete;
    Cursor &operator=(const Cursor &) = delete;
    Cursor(Cursor &&other) noexcept;
    Cursor &operator=(Cursor &&other) noexcept;

    MDB_cursor *get() const { return cur_; }

    // positioning helpers; false on MDB_NOTFOUND, MdbError on anything else
    bool first(MDB_val &k, MDB_val &v);
    bool next(MDB_val &k, MDB_val &v);
    bool seekRange(std::string_view key, MDB_val &k, MDB_val &v);
    bool seekKey(std::string_view key, MDB_val &k, MDB_val &v);
    bool nextDup(MDB_val &k, MDB_val &v);

  private:
    bool step(MDB_val &k, MDB_val &v, int op);

    MDB_cursor *cur_{};
  };

  class Env
  {
  public:
    Env(const std::filesystem::path &path, size_t mapSizeBytes = size_t(20ull << 30), unsigned int maxDbs = 128);
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;
    Env(Env &&other) noexcept;
    Env &operator=(Env &&other) noexcept;

    MDB_env *raw() const;
    DbHandle nodes() const;
    DbHandle edges() const;
    DbHandle outEdges() const;
    DbHandle inEdges() const;

    DbHandle vectors() const;
    DbHandle vectorProperties() const;
    DbHandle hnswLinks() const;
    DbHandle hnswMeta() const;

    DbHandle metadata() const;

    // idx:<name>; non-unique indices are DUPSORT. Storage GraphError when the
    // table exists with the other uniqueness.
    DbHandle openIndex(Txn &tx, std::string_view name, bool unique);
    // empties the table; the handle stays open for readers still holding it
    void clearIndex(Txn &tx, DbHandle dbi);

  private:
    static void open(MDB_txn *tx, DbHandle &out, const char *name, unsigned int flags = 0);

    MDB_env *env_{};
    DbHandle nodes_{};
    DbHandle edges_{};
    DbHandle outEdges_{};
    DbHandle inEdges_{};

    DbHandle vectors_{};
    DbHandle vectorProperties_{};
    DbHandle hnswLinks_{};
    DbHandle hnswMeta_{};

    DbHandle metadata_{};
  };

} // namespace quasar
