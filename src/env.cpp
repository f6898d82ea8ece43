#include "env.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <utility>

namespace quasar
{

  Txn::Txn(MDB_env *env, bool rw) : env_(env), rw_(rw)
  {
    int rc = mdb_txn_begin(env_, nullptr, rw_ ? 0 : MDB_RDONLY, &txn_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Txn::~Txn() noexcept
  {
    if (txn_)
      mdb_txn_abort(txn_);
  }

  Txn::Txn(Txn &&other) noexcept : env_(other.env_), txn_(other.txn_), rw_(other.rw_)
  {
    other.txn_ = nullptr;
  }

  Txn &Txn::operator=(Txn &&other) noexcept
  {
    if (this != &other)
    {
      abort();
      env_ = other.env_;
      txn_ = other.txn_;
      rw_ = other.rw_;
      other.txn_ = nullptr;
    }
    return *this;
  }

  MDB_txn *Txn::get() const { return txn_; }

  void Txn::commit()
  {
    int rc = mdb_txn_commit(txn_);
    txn_ = nullptr;
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
    {
      mdb_txn_abort(txn_);
      txn_ = nullptr;
    }
  }

  Cursor::Cursor(const Txn &tx, DbHandle dbi)
  {
    int rc = mdb_cursor_open(tx.get(), dbi, &cur_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  Cursor::~Cursor() noexcept
  {
    if (cur_)
      mdb_cursor_close(cur_);
  }

  Cursor::Cursor(Cursor &&other) noexcept : cur_(other.cur_)
  {
    other.cur_ = nullptr;
  }

  Cursor &Cursor::operator=(Cursor &&other) noexcept
  {
    if (this != &other)
    {
      if (cur_)
        mdb_cursor_close(cur_);
      cur_ = other.cur_;
      other.cur_ = nullptr;
    }
    return *this;
  }

  bool Cursor::step(MDB_val &k, MDB_val &v, int op)
  {
    int rc = mdb_cursor_get(cur_, &k, &v, static_cast<MDB_cursor_op>(op));
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  bool Cursor::first(MDB_val &k, MDB_val &v) { return step(k, v, MDB_FIRST); }
  bool Cursor::next(MDB_val &k, MDB_val &v) { return step(k, v, MDB_NEXT); }
  bool Cursor::nextDup(MDB_val &k, MDB_val &v) { return step(k, v, MDB_NEXT_DUP); }

  bool Cursor::seekRange(std::string_view key, MDB_val &k, MDB_val &v)
  {
    k = MDB_val{key.size(), const_cast<char *>(key.data())};
    return step(k, v, MDB_SET_RANGE);
  }

  bool Cursor::seekKey(std::string_view key, MDB_val &k, MDB_val &v)
  {
    k = MDB_val{key.size(), const_cast<char *>(key.data())};
    return step(k, v, MDB_SET_KEY);
  }

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes, unsigned int maxDbs)
  {
    int rc = mdb_env_create(&env_);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    mdb_env_set_maxdbs(env_, maxDbs);
    mdb_env_set_mapsize(env_, mapSizeBytes);
    // MDB_NOTLS: read txns are owned by whichever worker thread opened them
    rc = mdb_env_open(env_, path.c_str(), MDB_NOTLS, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(mdb_strerror(rc));
    }
    Txn tx(env_, true);
    open(tx.get(), nodes_, "nodes");
    open(tx.get(), edges_, "edges");
    open(tx.get(), outEdges_, "out_edges", MDB_DUPSORT | MDB_DUPFIXED);
    open(tx.get(), inEdges_, "in_edges", MDB_DUPSORT | MDB_DUPFIXED);

    open(tx.get(), vectors_, "vectors");
    open(tx.get(), vectorProperties_, "vector_properties");
    open(tx.get(), hnswLinks_, "hnsw_links");
    open(tx.get(), hnswMeta_, "hnsw_meta");

    open(tx.get(), metadata_, "metadata");
    tx.commit();
  }

  Env::~Env() noexcept
  {
    if (env_)
      mdb_env_close(env_);
  }

  Env::Env(Env &&other) noexcept
      : env_(other.env_),
        nodes_(other.nodes_),
        edges_(other.edges_),
        outEdges_(other.outEdges_),
        inEdges_(other.inEdges_),
        vectors_(other.vectors_),
        vectorProperties_(other.vectorProperties_),
        hnswLinks_(other.hnswLinks_),
        hnswMeta_(other.hnswMeta_),
        metadata_(other.metadata_)
  {
    other.env_ = nullptr;
  }

  Env &Env::operator=(Env &&other) noexcept
  {
    if (this != &other)
    {
      if (env_)
        mdb_env_close(env_);
      env_ = other.env_;
      nodes_ = other.nodes_;
      edges_ = other.edges_;
      outEdges_ = other.outEdges_;
      inEdges_ = other.inEdges_;

      vectors_ = other.vectors_;
      vectorProperties_ = other.vectorProperties_;
      hnswLinks_ = other.hnswLinks_;
      hnswMeta_ = other.hnswMeta_;

      metadata_ = other.metadata_;
      other.env_ = nullptr;
    }
    return *this;
  }

  MDB_env *Env::raw() const { return env_; }
  DbHandle Env::nodes() const { return nodes_; }
  DbHandle Env::edges() const { return edges_; }
  DbHandle Env::outEdges() const { return outEdges_; }
  DbHandle Env::inEdges() const { return inEdges_; }

  DbHandle Env::vectors() const { return vectors_; }
  DbHandle Env::vectorProperties() const { return vectorProperties_; }
  DbHandle Env::hnswLinks() const { return hnswLinks_; }
  DbHandle Env::hnswMeta() const { return hnswMeta_; }

  DbHandle Env::metadata() const { return metadata_; }

  DbHandle Env::openIndex(Txn &tx, std::string_view name, bool unique)
  {
    auto mismatch = [&]
    {
      return GraphError(GraphError::Code::Storage, "secondary index " + std::string(name) + " already exists with " +
                                                       (unique ? "duplicate" : "unique") + " keys");
    };
    DbHandle dbi{};
    std::string table = index_table_name(name);
    int rc = mdb_dbi_open(tx.get(), table.c_str(), MDB_CREATE | (unique ? 0u : unsigned(MDB_DUPSORT)), &dbi);
    if (rc == MDB_INCOMPATIBLE)
      throw mismatch();
    if (rc)
      throw MdbError(mdb_strerror(rc));

    // a handle opened earlier in this process is returned without a flag check
    unsigned int flags = 0;
    rc = mdb_dbi_flags(tx.get(), dbi, &flags);
    if (rc)
      throw MdbError(mdb_strerror(rc));
    if (bool((flags & MDB_DUPSORT) != 0) == unique)
      throw mismatch();
    return dbi;
  }

  void Env::clearIndex(Txn &tx, DbHandle dbi)
  {
    int rc = mdb_drop(tx.get(), dbi, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  void Env::open(MDB_txn *tx, DbHandle &out, const char *name, unsigned int flags)
  {
    int rc = mdb_dbi_open(tx, name, MDB_CREATE | flags, &out);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

} // namespace quasar
