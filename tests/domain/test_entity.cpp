/**
 * @file test_entity.cpp
 * @brief Unit tests for Entity identity and IdEqualityComparer
 */

#include <gtest/gtest.h>
#include <ddd/domain/Entity.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

using namespace ddd::domain;
using ddd::exception::InvalidArgumentException;

namespace {

const std::string kFirstId = "ae61412c-0bab-47f0-82f7-39520ede5639";
const std::string kSecondId = "ec52b5ee-3847-4612-9fe5-7f8c838f55c5";

template<typename IdType>
class TestEntity : public Entity<IdType> {
public:
    TestEntity() = default;
    explicit TestEntity(IdType id) : Entity<IdType>(std::move(id)) {}

    // Simulates persistence assigning identity after creation
    void assignId(IdType id) { this->setId(std::move(id)); }
};

class Customer : public Entity<std::string> {
public:
    Customer() = default;
    explicit Customer(std::string id) : Entity(std::move(id)) {}
};

class Supplier : public Entity<std::string> {
public:
    Supplier() = default;
    explicit Supplier(std::string id) : Entity(std::move(id)) {}
};

// Stands in for a runtime-generated persistence proxy reporting TEntity
template<typename TEntity>
class CustomerProxy : public Customer {
public:
    CustomerProxy() = default;
    explicit CustomerProxy(std::string id) : Customer(std::move(id)) {}

protected:
    std::type_index getUnproxiedType() const override {
        return typeid(TEntity);
    }
};

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(EntityTest, IntIdIsInitialized) {
    TestEntity<int> sut(1);

    EXPECT_EQ(sut.getId(), 1);
    EXPECT_FALSE(sut.isTransient());
}

TEST(EntityTest, StringIdIsInitialized) {
    TestEntity<std::string> sut(kFirstId);

    EXPECT_EQ(sut.getId(), kFirstId);
    EXPECT_FALSE(sut.isTransient());
}

TEST(EntityTest, DefaultConstructedEntityIsTransient) {
    TestEntity<int> intEntity;
    TestEntity<std::string> stringEntity;
    TestEntity<std::optional<long>> optionalEntity;

    EXPECT_EQ(intEntity.getId(), 0);
    EXPECT_TRUE(intEntity.isTransient());
    EXPECT_TRUE(stringEntity.getId().empty());
    EXPECT_TRUE(stringEntity.isTransient());
    EXPECT_FALSE(optionalEntity.getId().has_value());
    EXPECT_TRUE(optionalEntity.isTransient());
}

TEST(EntityTest, ConstructorRejectsDefaultIntId) {
    try {
        TestEntity<int> sut(0);
        FAIL() << "Expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(e.getParamName(), "id");
        EXPECT_EQ(e.getCode(), "INVALID_ARGUMENT");
        EXPECT_EQ(std::string(e.what()),
                  "Entity Id should not be null or default value. (Parameter 'id')");
    }
}

TEST(EntityTest, ConstructorRejectsEmptyStringId) {
    EXPECT_THROW(TestEntity<std::string>(""), InvalidArgumentException);
}

TEST(EntityTest, ConstructorRejectsAbsentOptionalId) {
    EXPECT_THROW(TestEntity<std::optional<long>>(std::nullopt), InvalidArgumentException);
}

TEST(EntityTest, AssignedIdMakesEntityNonTransient) {
    TestEntity<int> sut;
    ASSERT_TRUE(sut.isTransient());

    sut.assignId(42);

    EXPECT_EQ(sut.getId(), 42);
    EXPECT_FALSE(sut.isTransient());
}

TEST(EntityTest, MovePreservesId) {
    TestEntity<std::string> source(kFirstId);
    TestEntity<std::string> target(std::move(source));

    EXPECT_EQ(target.getId(), kFirstId);
}

// =============================================================================
// IdEqualityComparer
// =============================================================================

class IdEqualityComparerTest : public ::testing::Test {
protected:
    const Entity<std::string>::IdEqualityComparer& sut = Entity<std::string>::idEqualityComparer();
};

TEST_F(IdEqualityComparerTest, EntityEqualsItself) {
    Customer entity(kFirstId);

    EXPECT_TRUE(sut(entity, entity));
    EXPECT_TRUE(sut(&entity, &entity));
}

TEST_F(IdEqualityComparerTest, EntityNotEqualToNull) {
    Customer entity(kFirstId);

    EXPECT_FALSE(sut(&entity, nullptr));
    EXPECT_FALSE(sut(nullptr, &entity));
    EXPECT_FALSE(sut.equals(&entity, nullptr));
}

TEST_F(IdEqualityComparerTest, BothNullAreEqual) {
    EXPECT_TRUE(sut(nullptr, nullptr));
}

TEST_F(IdEqualityComparerTest, SameTypeSameIdAreEqual) {
    Customer first(kFirstId);
    Customer second(kFirstId);

    EXPECT_TRUE(sut(first, second));
    EXPECT_EQ(sut.hash(first), sut.hash(second));
}

TEST_F(IdEqualityComparerTest, DifferentIdsAreNotEqual) {
    Customer first(kFirstId);
    Customer second(kSecondId);

    EXPECT_FALSE(sut(first, second));
}

TEST_F(IdEqualityComparerTest, TransientEntitiesAreEqual) {
    Customer first;
    Customer second;

    EXPECT_TRUE(sut(first, second));
}

TEST_F(IdEqualityComparerTest, TransientNotEqualToNonTransient) {
    Customer transient;
    Customer persisted(kFirstId);

    EXPECT_FALSE(sut(transient, persisted));
    EXPECT_FALSE(sut(persisted, transient));
}

TEST_F(IdEqualityComparerTest, DifferentTypesAreNotEqual) {
    Customer customer(kFirstId);
    Supplier supplier(kFirstId);

    EXPECT_FALSE(sut(customer, supplier));
}

TEST_F(IdEqualityComparerTest, SameUnproxiedTypeIsEqual) {
    Customer customer(kFirstId);
    CustomerProxy<Customer> proxy(kFirstId);

    EXPECT_TRUE(sut(customer, proxy));
    EXPECT_TRUE(sut(proxy, customer));
    EXPECT_EQ(sut.hash(customer), sut.hash(proxy));
}

TEST_F(IdEqualityComparerTest, DifferentUnproxiedTypesAreNotEqual) {
    CustomerProxy<Customer> customerProxy(kFirstId);
    CustomerProxy<Supplier> supplierProxy(kFirstId);

    EXPECT_FALSE(sut(customerProxy, supplierProxy));
}

TEST_F(IdEqualityComparerTest, SharedPointersCompareByIdentity) {
    std::shared_ptr<const Entity<std::string>> first = std::make_shared<Customer>(kFirstId);
    std::shared_ptr<const Entity<std::string>> second = std::make_shared<Customer>(kFirstId);
    std::shared_ptr<const Entity<std::string>> empty;

    EXPECT_TRUE(sut(first, second));
    EXPECT_FALSE(sut(first, empty));
}

TEST_F(IdEqualityComparerTest, NullHashIsZero) {
    EXPECT_EQ(sut.hash(nullptr), 0u);
}

TEST_F(IdEqualityComparerTest, UsableInUnorderedSet) {
    Customer first(kFirstId);
    Customer sameAsFirst(kFirstId);
    Customer second(kSecondId);
    Supplier supplier(kFirstId);

    std::unordered_set<const Entity<std::string>*,
                       Entity<std::string>::IdHash,
                       Entity<std::string>::IdEqualityComparer> identities;
    identities.insert(&first);
    identities.insert(&sameAsFirst);
    identities.insert(&second);
    identities.insert(&supplier);

    EXPECT_EQ(identities.size(), 3u);
}
