#include "test_support.hpp"
#include "codec.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <kj/exception.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace quasar;
using quasar::test::idOf;

namespace
{

  class Storage : public quasar::test::StorageTest
  {
  };

  class IndexedStorage : public quasar::test::StorageTest
  {
  protected:
    Config config() const override
    {
      Config c = StorageTest::config();
      c.secondaryIndices.push_back(SecondaryIndexConfig{"name", false});
      c.secondaryIndices.push_back(SecondaryIndexConfig{"email", true});
      return c;
    }
  };

  std::vector<Id> idsOf(const std::vector<TraversalValue> &values)
  {
    std::vector<Id> ids;
    for (const auto &v : values)
      ids.push_back(idOf(v));
    return ids;
  }

} // namespace

TEST_F(Storage, NodeRoundTrip)
{
  Id id = addNode("person", {{"name", std::string("John")}, {"age", int64_t{30}}, {"score", 1.5}});

  kj::Arena arena;
  Txn tx = storage().readTxn();
  Node n = storage().getNode(tx, arena, id);
  EXPECT_TRUE(n.id == id);
  EXPECT_EQ(n.label, "person");
  EXPECT_EQ(n.version, 1);
  ASSERT_NE(n.get("name"), nullptr);
  EXPECT_EQ(std::get<std::string>(*n.get("name")), "John");
  EXPECT_EQ(std::get<int64_t>(*n.get("age")), 30);
  EXPECT_DOUBLE_EQ(std::get<double>(*n.get("score")), 1.5);
  EXPECT_EQ(n.get("missing"), nullptr);
}

TEST_F(Storage, NodeWithoutPropertiesStoresNone)
{
  Id id = addNode("empty");
  kj::Arena arena;
  Txn tx = storage().readTxn();
  Node n = storage().getNode(tx, arena, id);
  EXPECT_EQ(n.properties, nullptr);
}

TEST_F(Storage, MissingNodeAndEdge)
{
  kj::Arena arena;
  Txn tx = storage().readTxn();
  try
  {
    storage().getNode(tx, arena, newId());
    FAIL() << "expected NodeNotFound";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::NodeNotFound);
  }
  try
  {
    storage().getEdge(tx, arena, newId());
    FAIL() << "expected EdgeNotFound";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::EdgeNotFound);
  }
}

TEST_F(Storage, EdgeRoundTripAndAdjacency)
{
  Id a = addNode("person");
  Id b = addNode("person");
  Id e = addEdge("knows", a, b, {{"since", int64_t{2020}}});

  kj::Arena arena;
  Txn tx = storage().readTxn();
  Edge edge = storage().getEdge(tx, arena, e);
  EXPECT_EQ(edge.label, "knows");
  EXPECT_TRUE(edge.fromNode == a);
  EXPECT_TRUE(edge.toNode == b);
  EXPECT_EQ(std::get<int64_t>(*edge.get("since")), 2020);

  auto out = RoTraversal(storage(), tx, arena).nFromId(a).outNode("knows").collect();
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(idOf(out[0]) == b);

  auto in = RoTraversal(storage(), tx, arena).nFromId(b).inNode("knows").collect();
  ASSERT_EQ(in.size(), 1u);
  EXPECT_TRUE(idOf(in[0]) == a);

  // other labels do not leak into the walk
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromId(a).outNode("likes").count(), 0u);
}

TEST_F(IndexedStorage, CascadingDelete)
{
  Id a = addNode("person", {{"name", std::string("Ann")}});
  Id b = addNode("person", {{"name", std::string("Bob")}});
  Id c = addNode("person", {{"name", std::string("Cid")}});
  Id ab = addEdge("knows", a, b);
  Id ca = addEdge("knows", c, a);
  Id bc = addEdge("knows", b, c);

  {
    Txn tx = storage().writeTxn();
    storage().dropNode(tx, a);
    tx.commit();
  }

  kj::Arena arena;
  Txn tx = storage().readTxn();
  EXPECT_THROW(storage().getNode(tx, arena, a), GraphError);
  EXPECT_THROW(storage().getEdge(tx, arena, ab), GraphError);
  EXPECT_THROW(storage().getEdge(tx, arena, ca), GraphError);
  EXPECT_NO_THROW(storage().getEdge(tx, arena, bc));

  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromId(b).inNode("knows").count(), 0u);
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromId(c).outNode("knows").count(), 0u);
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromId(b).outNode("knows").count(), 1u);
  EXPECT_TRUE(storage().lookupIndex(tx, "name", Value(std::string("Ann"))).empty());
  EXPECT_EQ(storage().lookupIndex(tx, "name", Value(std::string("Bob"))).size(), 1u);
}

TEST_F(IndexedStorage, IndexFollowsUpdate)
{
  Id id = addNode("person", {{"name", std::string("John")}});

  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    auto updated = RwTraversal(storage(), tx, arena).nFromId(id).update({{"name", std::string("Jane")}}).collect();
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_EQ(std::get<std::string>(*updated[0].get("name")), "Jane");
    tx.commit();
  }

  kj::Arena arena;
  Txn tx = storage().readTxn();
  auto jane = RoTraversal(storage(), tx, arena).nFromIndex("person", "name", std::string("Jane")).collect();
  ASSERT_EQ(jane.size(), 1u);
  EXPECT_TRUE(idOf(jane[0]) == id);
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromIndex("person", "name", std::string("John")).count(), 0u);
}

TEST_F(IndexedStorage, UpdateThatIsAbortedLeavesIndexAlone)
{
  Id id = addNode("person", {{"name", std::string("John")}});
  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    RwTraversal(storage(), tx, arena).nFromId(id).update({{"name", std::string("Jane")}}).collect();
    // no commit
  }
  kj::Arena arena;
  Txn tx = storage().readTxn();
  EXPECT_EQ(idsOf(RoTraversal(storage(), tx, arena).nFromIndex("person", "name", std::string("John")).collect()).size(), 1u);
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromIndex("person", "name", std::string("Jane")).count(), 0u);
}

TEST_F(IndexedStorage, NonUniqueIndexHoldsSeveralNodes)
{
  Id a = addNode("person", {{"name", std::string("Sam")}});
  Id b = addNode("person", {{"name", std::string("Sam")}});
  addNode("robot", {{"name", std::string("Sam")}});

  kj::Arena arena;
  Txn tx = storage().readTxn();
  auto ids = storage().lookupIndex(tx, "name", Value(std::string("Sam")));
  EXPECT_EQ(ids.size(), 3u);
  auto people = idsOf(RoTraversal(storage(), tx, arena).nFromIndex("person", "name", std::string("Sam")).collect());
  ASSERT_EQ(people.size(), 2u);
  EXPECT_TRUE((people[0] == a && people[1] == b) || (people[0] == b && people[1] == a));
}

TEST_F(IndexedStorage, UniqueIndexRejectsDuplicate)
{
  addNode("person", {{"email", std::string("a@example.com")}});

  kj::Arena arena;
  Txn tx = storage().writeTxn();
  try
  {
    RwTraversal(storage(), tx, arena).addN("person", {{"email", std::string("a@example.com")}}).collect();
    FAIL() << "expected DuplicateKey";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::DuplicateKey);
  }
}

TEST_F(IndexedStorage, RejectedUpdateKeepsIndexConsistent)
{
  Id first = addNode("person", {{"email", std::string("a@example.com")}});
  Id second = addNode("person", {{"email", std::string("b@example.com")}});

  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    auto written = RwTraversal(storage(), tx, arena)
                       .nFromId(second)
                       .update({{"email", std::string("a@example.com")}})
                       .collectOk();
    EXPECT_TRUE(written.empty());
    tx.commit();
  }

  kj::Arena arena;
  Txn tx = storage().readTxn();
  Node n = storage().getNode(tx, arena, second);
  EXPECT_EQ(std::get<std::string>(*n.get("email")), "b@example.com");
  auto owner = storage().lookupIndex(tx, "email", Value(std::string("b@example.com")));
  ASSERT_EQ(owner.size(), 1u);
  EXPECT_TRUE(owner[0] == second);
  auto other = storage().lookupIndex(tx, "email", Value(std::string("a@example.com")));
  ASSERT_EQ(other.size(), 1u);
  EXPECT_TRUE(other[0] == first);
}

TEST_F(IndexedStorage, RejectedAddWritesNoIndexEntries)
{
  // "name" comes before "zip" in index order
  storage().createSecondaryIndex(SecondaryIndexConfig{"zip", true});
  addNode("person", {{"name", std::string("Ann")}, {"zip", std::string("0150")}});

  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    EXPECT_FALSE(RwTraversal(storage(), tx, arena)
                     .addN("person", {{"name", std::string("Bea")}, {"zip", std::string("0150")}})
                     .exist());
    tx.commit();
  }

  kj::Arena arena;
  Txn tx = storage().readTxn();
  EXPECT_TRUE(storage().lookupIndex(tx, "name", Value(std::string("Bea"))).empty());
  EXPECT_EQ(RoTraversal(storage(), tx, arena).nFromType("person").count(), 1u);
}

TEST_F(IndexedStorage, UpsertMovesIndexEntries)
{
  Id id{};
  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    auto inserted = RwTraversal(storage(), tx, arena)
                        .nFromIndex("person", "email", std::string("x@example.com"))
                        .upsertN("person", {{"email", std::string("x@example.com")}})
                        .collect();
    ASSERT_EQ(inserted.size(), 1u);
    id = idOf(inserted[0]);
    tx.commit();
  }
  {
    kj::Arena arena;
    Txn tx = storage().writeTxn();
    auto updated = RwTraversal(storage(), tx, arena)
                       .nFromIndex("person", "email", std::string("x@example.com"))
                       .upsertN("person", {{"email", std::string("y@example.com")}})
                       .collect();
    ASSERT_EQ(updated.size(), 1u);
    EXPECT_TRUE(idOf(updated[0]) == id);
    tx.commit();
  }
  Txn tx = storage().readTxn();
  EXPECT_TRUE(storage().lookupIndex(tx, "email", Value(std::string("x@example.com"))).empty());
  auto ids = storage().lookupIndex(tx, "email", Value(std::string("y@example.com")));
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_TRUE(ids[0] == id);
}

TEST_F(IndexedStorage, UnknownIndexIsATraversalError)
{
  kj::Arena arena;
  Txn tx = storage().readTxn();
  auto items = RoTraversal(storage(), tx, arena).nFromIndex("person", "nope", std::string("x")).release();
  auto first = items->next();
  ASSERT_TRUE(first.has_value());
  ASSERT_FALSE(first->ok());
  EXPECT_EQ(first->error().code(), GraphError::Code::Traversal);
}

TEST_F(Storage, RuntimeIndexCreateAndDrop)
{
  storage().createSecondaryIndex(SecondaryIndexConfig{"city", false});
  auto names = storage().secondaryIndexNames();
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], "city");

  Id id = addNode("person", {{"city", std::string("Oslo")}});
  {
    kj::Arena arena;
    Txn tx = storage().readTxn();
    auto ids = storage().lookupIndex(tx, "city", Value(std::string("Oslo")));
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_TRUE(ids[0] == id);
  }

  storage().dropSecondaryIndex("city");
  EXPECT_FALSE(storage().secondaryIndex("city").has_value());
  Txn tx = storage().readTxn();
  try
  {
    storage().lookupIndex(tx, "city", Value(std::string("Oslo")));
    FAIL() << "expected unknown index";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Traversal);
  }
}

TEST_F(Storage, DroppedIndexHandleStaysReadable)
{
  storage().createSecondaryIndex(SecondaryIndexConfig{"city", false});
  addNode("person", {{"city", std::string("Oslo")}});
  auto held = storage().secondaryIndex("city");
  ASSERT_TRUE(held.has_value());

  storage().dropSecondaryIndex("city");
  storage().createSecondaryIndex(SecondaryIndexConfig{"zone", false});
  addNode("person", {{"zone", std::string("north")}});

  // a reader still holding the old handle sees an empty table
  Txn tx = storage().readTxn();
  Cursor cur(tx, held->dbi);
  MDB_val k{}, v{};
  EXPECT_FALSE(cur.first(k, v));

  try
  {
    storage().createSecondaryIndex(SecondaryIndexConfig{"city", true});
    FAIL() << "expected a uniqueness mismatch";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Storage);
    EXPECT_NE(std::string(e.what()).find("city"), std::string::npos);
  }
}

TEST_F(Storage, ReopeningIndexWithOtherUniquenessIsRefused)
{
  storage().createSecondaryIndex(SecondaryIndexConfig{"city", false});
  storage_.reset();

  Config c = config();
  c.secondaryIndices.push_back(SecondaryIndexConfig{"city", true});
  try
  {
    GraphStorage reopened(dataDir_, c);
    FAIL() << "expected a uniqueness mismatch";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Storage);
    EXPECT_NE(std::string(e.what()).find("city"), std::string::npos);
  }
}

TEST_F(Storage, IndexCreationWaitsForOpenWriter)
{
  kj::Arena arena;
  Txn tx = storage().writeTxn();
  std::atomic<bool> created{false};
  std::thread creator([&]
                      {
    storage().createSecondaryIndex(SecondaryIndexConfig{"city", false});
    created = true; });

  // give the creator time to block on the writer lock
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(created.load());
  storage().addNode(tx, arena, "person", {{"name", std::string("Ann")}});
  tx.commit();

  creator.join();
  EXPECT_TRUE(created.load());
  EXPECT_TRUE(storage().secondaryIndex("city").has_value());
}

TEST_F(Storage, RecordsUpgradeToLatestVersionOnRead)
{
  Id id = addNode("person", {{"name", std::string("John")}});

  VersionInfo versions;
  versions.setLatest("person", 3);
  versions.addTransition("person", 1, [](Properties &props)
                         { setProperty(props, "nickname", std::string("JJ")); });
  versions.addTransition("person", 2, [](Properties &props)
                         { setProperty(props, "name", std::string("Johnny")); });
  reopen(std::move(versions));

  kj::Arena arena;
  Txn tx = storage().readTxn();
  Node n = storage().getNode(tx, arena, id);
  EXPECT_EQ(n.version, 3);
  EXPECT_EQ(std::get<std::string>(*n.get("nickname")), "JJ");
  EXPECT_EQ(std::get<std::string>(*n.get("name")), "Johnny");

  auto scanned = RoTraversal(storage(), tx, arena).nFromType("person").collect();
  ASSERT_EQ(scanned.size(), 1u);
  EXPECT_EQ(std::get<Node>(scanned[0]).version, 3);
}

TEST_F(Storage, NewRecordsTakeLatestVersion)
{
  VersionInfo versions;
  versions.setLatest("person", 2);
  reopen(std::move(versions));

  Id id = addNode("person");
  kj::Arena arena;
  Txn tx = storage().readTxn();
  EXPECT_EQ(storage().getNode(tx, arena, id).version, 2);
}

TEST_F(Storage, CorruptHeaderIsFatal)
{
  Id id = newId();
  {
    Txn tx = storage().writeTxn();
    std::string key = key_id_be(id);
    std::string junk = "abc";
    MDB_val k{key.size(), key.data()};
    MDB_val v{junk.size(), junk.data()};
    ASSERT_EQ(mdb_put(tx.get(), storage().env().nodes(), &k, &v, 0), 0);
    tx.commit();
  }
  kj::Arena arena;
  Txn tx = storage().readTxn();
  EXPECT_THROW(storage().getNode(tx, arena, id), kj::Exception);
}

TEST_F(Storage, TruncatedPropertiesAreADecodeError)
{
  Id id = newId();
  {
    Node n{};
    n.id = id;
    n.label = "person";
    Properties props{{"name", std::string("John")}};
    n.properties = &props;
    std::string bytes = encodeNode(n);
    bytes.resize(bytes.size() - 2);

    Txn tx = storage().writeTxn();
    std::string key = key_id_be(id);
    MDB_val k{key.size(), key.data()};
    MDB_val v{bytes.size(), bytes.data()};
    ASSERT_EQ(mdb_put(tx.get(), storage().env().nodes(), &k, &v, 0), 0);
    tx.commit();
  }
  kj::Arena arena;
  Txn tx = storage().readTxn();
  try
  {
    storage().getNode(tx, arena, id);
    FAIL() << "expected Decode";
  }
  catch (const GraphError &e)
  {
    EXPECT_EQ(e.code(), GraphError::Code::Decode);
  }
}
