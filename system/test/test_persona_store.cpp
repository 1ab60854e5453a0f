// ============= test/test_persona_store.cpp =============
#include "persona_store.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

class PersonaStoreTest : public ::testing::TestWithParam<BackendKind> {
protected:
    StoreConfig make_config(int dimension = 4) const {
        return GetParam() == BackendKind::Sqlite ? sqlite_config(tmp, dimension)
                                                 : fallback_config(tmp, dimension);
    }

    void SetUp() override {
        store = std::make_unique<PersonaStore>(make_config());
        store->initialize();
    }

    Entity make(const std::string& name, const std::string& category = "") {
        EntityDraft draft;
        draft.name = name;
        draft.category = category;
        return store->create_entity(draft);
    }

    TempDir tmp;
    std::unique_ptr<PersonaStore> store;
};

TEST_P(PersonaStoreTest, SelectsExpectedBackend) {
    EXPECT_EQ(store->state(), StoreState::Operational);
    EXPECT_EQ(store->backend_kind(), GetParam());
}

TEST_P(PersonaStoreTest, CreateThenGetRoundTrips) {
    EntityDraft draft;
    draft.name = "Naruto Uzumaki";
    draft.description = "Energetic ninja";
    draft.kind = EntityKind::FictionalCharacter;
    draft.category = "anime";
    draft.source = "Naruto";
    draft.notes = "Ne-Fi";

    Entity created = store->create_entity(draft);
    EXPECT_FALSE(created.id.empty());

    Entity fetched = store->get_entity(created.id);
    EXPECT_EQ(fetched, created);
    EXPECT_EQ(fetched.name, draft.name);
    EXPECT_EQ(fetched.description, draft.description);
    EXPECT_EQ(fetched.kind, draft.kind);
    EXPECT_EQ(fetched.category, draft.category);
    EXPECT_EQ(fetched.source, draft.source);
    EXPECT_EQ(fetched.notes, draft.notes);

    EXPECT_NE(make("Other").id, created.id);
}

TEST_P(PersonaStoreTest, GetMissingEntityIsNotFound) {
    EXPECT_THROW(store->get_entity("does-not-exist"), NotFoundError);
    EXPECT_THROW(store->get_entity(""), ValidationError);
    EXPECT_THROW(store->get_user("nobody"), NotFoundError);
}

TEST_P(PersonaStoreTest, AdaLovelaceScenario) {
    EntityDraft draft;
    draft.name = "Ada Lovelace";
    draft.kind = EntityKind::PublicFigure;
    Entity ada = store->create_entity(draft);

    Rating rating;
    rating.entity_id = ada.id;
    rating.rater_id = "rater-7";
    rating.system = "mbti";
    rating.type_code = "INTJ";
    rating.confidence = 0.8;
    store->add_rating(rating);

    auto ratings = store->list_ratings(ada.id);
    ASSERT_EQ(ratings.size(), 1u);
    EXPECT_EQ(ratings[0].type_code, "INTJ");
    EXPECT_DOUBLE_EQ(ratings[0].confidence, 0.8);

    Entity fetched = store->get_entity(ada.id);
    ASSERT_EQ(fetched.typings.size(), 1u);
    EXPECT_EQ(fetched.typings[0].system, "mbti");
    EXPECT_EQ(fetched.typings[0].type_code, "INTJ");
    EXPECT_DOUBLE_EQ(fetched.typings[0].mean_confidence, 0.8);

    StoreStats stats = store->stats();
    EXPECT_EQ(stats.entity_count, 1);
    EXPECT_EQ(stats.rating_count, 1);
}

TEST_P(PersonaStoreTest, RenameTwiceYieldsTwoHistoryRecordsNewestFirst) {
    Entity e = make("A");
    store->update_entity(e.id, {{"name", "B"}}, "editor");
    store->update_entity(e.id, {{"name", "A"}}, "editor");

    auto history = store->list_edit_history(e.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].old_value, "B");
    EXPECT_EQ(history[0].new_value, "A");
    EXPECT_EQ(history[1].old_value, "A");
    EXPECT_EQ(history[1].new_value, "B");
    EXPECT_GT(history[0].created_at, history[1].created_at);
    EXPECT_EQ(store->get_entity(e.id).name, "A");
}

TEST_P(PersonaStoreTest, ConfidenceBoundaries) {
    Entity e = make("Bounded");

    Rating rating;
    rating.entity_id = e.id;
    rating.rater_id = "r";
    rating.system = "socionics";
    rating.type_code = "LII";

    rating.confidence = 0.0;
    EXPECT_NO_THROW(store->add_rating(rating));
    rating.confidence = 1.0;
    EXPECT_NO_THROW(store->add_rating(rating));
    rating.confidence = 1.5;
    EXPECT_THROW(store->add_rating(rating), ValidationError);
    rating.confidence = -0.5;
    EXPECT_THROW(store->add_rating(rating), ValidationError);

    EXPECT_EQ(store->list_ratings(e.id).size(), 2u);
}

TEST_P(PersonaStoreTest, RatingAndCommentOnMissingEntity) {
    Rating rating;
    rating.entity_id = "ghost";
    rating.rater_id = "r";
    rating.system = "mbti";
    rating.type_code = "INTP";
    rating.confidence = 0.5;
    EXPECT_THROW(store->add_rating(rating), NotFoundError);

    Comment comment;
    comment.entity_id = "ghost";
    comment.user_id = "u";
    comment.content = "hello";
    EXPECT_THROW(store->add_comment(comment), NotFoundError);
    EXPECT_THROW(store->list_comments("ghost"), NotFoundError);
}

TEST_P(PersonaStoreTest, CategoryFilter) {
    make("Sherlock Holmes", "book");
    make("Naruto Uzumaki", "anime");
    make("Sasuke Uchiha", "anime");

    EntityQuery query;
    query.category = "anime";
    auto anime = store->list_entities(query);
    ASSERT_EQ(anime.size(), 2u);
    for (const auto& e : anime) {
        EXPECT_EQ(e.category, "anime");
    }

    query.category = "podcast";
    EXPECT_TRUE(store->list_entities(query).empty());
}

TEST_P(PersonaStoreTest, UsersAndComments) {
    User user;
    user.id = "u-1";
    user.username = "watson";
    user.display_name = "Dr. Watson";
    user.experience_level = "expert";
    store->add_user(user);

    User fetched = store->get_user("u-1");
    EXPECT_EQ(fetched.display_name, "Dr. Watson");
    EXPECT_EQ(fetched.experience_level, "expert");

    Entity e = make("Holmes");
    Comment comment;
    comment.entity_id = e.id;
    comment.user_id = "u-1";
    comment.content = "Brilliant";
    store->add_comment(comment);

    auto comments = store->list_comments(e.id);
    ASSERT_EQ(comments.size(), 1u);
    EXPECT_EQ(comments[0].user_display_name, "Dr. Watson");
    EXPECT_EQ(store->stats().comment_count, 1);
}

TEST_P(PersonaStoreTest, TypingSystemRegistration) {
    store->register_typing_system({"temperament", "Temperaments", "",
                                   {"sanguine", "choleric", "melancholic", "phlegmatic"}});
    store->register_typing_system({"temperament", "", "", {"phlegmatic", "supine"}});

    auto systems = store->list_typing_systems();
    auto it = std::find_if(systems.begin(), systems.end(),
                           [](const TypingSystem& s) { return s.name == "temperament"; });
    ASSERT_NE(it, systems.end());
    EXPECT_EQ(it->type_codes.size(), 5u);
    EXPECT_EQ(it->type_codes.back(), "supine");

    Entity e = make("Typed");
    Rating rating;
    rating.entity_id = e.id;
    rating.rater_id = "r";
    rating.system = "temperament";
    rating.type_code = "supine";
    rating.confidence = 0.4;
    EXPECT_NO_THROW(store->add_rating(rating));
}

TEST_P(PersonaStoreTest, VectorSearchFewerThanK) {
    Entity a = make("A");
    Entity b = make("B");
    store->add_embedding(a.id, {1.0f, 0.0f, 0.0f, 0.0f});
    store->add_embedding(b.id, {0.6f, 0.8f, 0.0f, 0.0f});

    auto matches = store->vector_search({1.0f, 0.0f, 0.0f, 0.0f}, 5);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].entity_id, a.id);
    EXPECT_NEAR(matches[0].similarity, 1.0f, 1e-5);
    EXPECT_EQ(matches[1].entity_id, b.id);
    EXPECT_NEAR(matches[1].similarity, 0.6f, 1e-5);
    EXPECT_NEAR(matches[1].distance, 0.4f, 1e-5);

    EXPECT_TRUE(store->vector_search({1.0f, 0.0f, 0.0f, 0.0f}, 0).empty());
}

TEST_P(PersonaStoreTest, TiesBreakByEntityId) {
    Entity a = make("A");
    Entity b = make("B");
    Entity c = make("C");
    store->add_embedding(a.id, unit(4, 1));
    store->add_embedding(b.id, unit(4, 2));
    store->add_embedding(c.id, unit(4, 3));

    auto matches = store->vector_search(unit(4, 0), 2);
    ASSERT_EQ(matches.size(), 2u);

    std::vector<std::string> ids = {a.id, b.id, c.id};
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(matches[0].entity_id, ids[0]);
    EXPECT_EQ(matches[1].entity_id, ids[1]);
}

TEST_P(PersonaStoreTest, ReplacingEmbeddingNeverReturnsStaleDuplicate) {
    Entity a = make("A");
    Entity b = make("B");
    store->add_embedding(a.id, unit(4, 0));
    store->add_embedding(b.id, unit(4, 1));
    store->add_embedding(a.id, unit(4, 2));

    EXPECT_EQ(store->indexed_vector_count(), 2u);

    auto matches = store->vector_search(unit(4, 0), 10);
    std::set<std::string> seen;
    for (const auto& m : matches) {
        EXPECT_TRUE(seen.insert(m.entity_id).second) << "duplicate " << m.entity_id;
    }
    EXPECT_EQ(matches.size(), 2u);

    auto top = store->vector_search(unit(4, 2), 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].entity_id, a.id);
    EXPECT_NEAR(top[0].similarity, 1.0f, 1e-5);
}

TEST_P(PersonaStoreTest, EmbeddingPreconditions) {
    Entity a = make("A");
    EXPECT_THROW(store->add_embedding(a.id, {1.0f, 2.0f}), DimensionMismatchError);
    EXPECT_THROW(store->add_embedding("ghost", unit(4, 0)), NotFoundError);
    EXPECT_THROW(store->add_embedding(a.id, {0.0f, 0.0f, 0.0f, 0.0f}), ValidationError);
    EXPECT_THROW(store->vector_search({1.0f}, 3), DimensionMismatchError);
    EXPECT_EQ(store->indexed_vector_count(), 0u);
}

TEST_P(PersonaStoreTest, CapacityExceededBeforePersisting) {
    StoreConfig cfg = make_config();
    cfg.capacity = 1;
    cfg.sqlite_path = tmp.file("small.sqlite");
    cfg.snapshot_path = tmp.file("small.json");
    PersonaStore small(cfg);
    small.initialize();

    EntityDraft draft;
    draft.name = "A";
    Entity a = small.create_entity(draft);
    draft.name = "B";
    Entity b = small.create_entity(draft);

    small.add_embedding(a.id, unit(4, 0));
    EXPECT_THROW(small.add_embedding(b.id, unit(4, 1)), CapacityExceededError);

    small.rebuild_vector_index(4);
    EXPECT_EQ(small.vector_capacity(), 4u);
    small.add_embedding(b.id, unit(4, 1));
    EXPECT_EQ(small.indexed_vector_count(), 2u);
}

TEST_P(PersonaStoreTest, InitializeTwiceIsIdempotent) {
    StoreStats before = store->stats();
    BackendKind kind = store->backend_kind();

    store->initialize();

    EXPECT_EQ(store->backend_kind(), kind);
    StoreStats after = store->stats();
    EXPECT_EQ(after.type_count, before.type_count);
    EXPECT_EQ(store->list_typing_systems().size(), 3u);
}

TEST_P(PersonaStoreTest, ReopenRebuildsIndexFromPersistedVectors) {
    Entity a = make("A");
    Entity b = make("B");
    store->add_embedding(a.id, unit(4, 0));
    store->add_embedding(b.id, unit(4, 1));
    store->add_embedding(a.id, unit(4, 2));
    store.reset();

    StoreConfig cfg = make_config();
    cfg.capacity = 1;
    PersonaStore reopened(cfg);
    reopened.initialize();

    EXPECT_EQ(reopened.list_typing_systems().size(), 3u);
    EXPECT_EQ(reopened.stats().entity_count, 2);
    EXPECT_EQ(reopened.indexed_vector_count(), 2u);
    EXPECT_GE(reopened.vector_capacity(), 2u);

    auto top = reopened.vector_search(unit(4, 2), 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].entity_id, a.id);
}

TEST_P(PersonaStoreTest, SubmitRunsOnWorkerPool) {
    Entity e = make("Async");

    auto name = store->submit([id = e.id](PersonaStore& s) { return s.get_entity(id).name; });
    EXPECT_EQ(name.get(), "Async");

    auto missing = store->submit([](PersonaStore& s) { return s.get_entity("ghost"); });
    EXPECT_THROW(missing.get(), NotFoundError);
}

TEST_P(PersonaStoreTest, ReplacingAtFullCapacityReusesRoom) {
    StoreConfig cfg = make_config();
    cfg.capacity = 1;
    cfg.sqlite_path = tmp.file("full.sqlite");
    cfg.snapshot_path = tmp.file("full.json");
    PersonaStore full(cfg);
    full.initialize();

    EntityDraft draft;
    draft.name = "A";
    Entity a = full.create_entity(draft);
    draft.name = "B";
    Entity b = full.create_entity(draft);

    full.add_embedding(a.id, unit(4, 0));
    EXPECT_NO_THROW(full.add_embedding(a.id, unit(4, 1)));
    EXPECT_NO_THROW(full.add_embedding(a.id, unit(4, 2)));

    EXPECT_EQ(full.indexed_vector_count(), 1u);
    EXPECT_EQ(full.vector_capacity(), 1u);

    auto top = full.vector_search(unit(4, 2), 5);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].entity_id, a.id);
    EXPECT_NEAR(top[0].similarity, 1.0f, 1e-5);

    EXPECT_THROW(full.add_embedding(b.id, unit(4, 3)), CapacityExceededError);
}

TEST_P(PersonaStoreTest, ReplacementsAfterGrowthKeepEveryEntity) {
    Entity a = make("A");
    Entity b = make("B");
    store->rebuild_vector_index(2);

    store->add_embedding(a.id, unit(4, 0));
    store->add_embedding(b.id, unit(4, 1));
    for (int round = 0; round < 4; ++round) {
        store->add_embedding(a.id, unit(4, round % 4));
        store->add_embedding(b.id, unit(4, (round + 1) % 4));
    }

    EXPECT_EQ(store->indexed_vector_count(), 2u);
    auto matches = store->vector_search(unit(4, 3), 5);
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].entity_id, a.id);
    EXPECT_NEAR(matches[0].similarity, 1.0f, 1e-5);
    EXPECT_EQ(matches[1].entity_id, b.id);
}

TEST_P(PersonaStoreTest, VectorSearchCarriesEntityNameAndKind) {
    EntityDraft draft;
    draft.name = "Ada Lovelace";
    draft.kind = EntityKind::PublicFigure;
    Entity ada = store->create_entity(draft);
    store->add_embedding(ada.id, unit(4, 0));

    auto matches = store->vector_search(unit(4, 0), 1);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].entity_name, "Ada Lovelace");
    EXPECT_EQ(matches[0].entity_kind, EntityKind::PublicFigure);
}

TEST_P(PersonaStoreTest, VectorSearchFiltersByKind) {
    EntityDraft draft;
    draft.kind = EntityKind::FictionalCharacter;
    draft.name = "Sherlock";
    Entity sherlock = store->create_entity(draft);
    draft.name = "Naruto";
    Entity naruto = store->create_entity(draft);
    draft.kind = EntityKind::PublicFigure;
    draft.name = "Ada";
    Entity ada = store->create_entity(draft);

    store->add_embedding(ada.id, {1.0f, 0.0f, 0.0f, 0.0f});
    store->add_embedding(sherlock.id, {0.8f, 0.6f, 0.0f, 0.0f});
    store->add_embedding(naruto.id, {0.0f, 1.0f, 0.0f, 0.0f});

    auto fictional = store->vector_search(unit(4, 0), 1, EntityKind::FictionalCharacter);
    ASSERT_EQ(fictional.size(), 1u);
    EXPECT_EQ(fictional[0].entity_id, sherlock.id);
    EXPECT_NEAR(fictional[0].similarity, 0.8f, 1e-5);

    auto all_fictional = store->vector_search(unit(4, 0), 10, EntityKind::FictionalCharacter);
    ASSERT_EQ(all_fictional.size(), 2u);
    EXPECT_EQ(all_fictional[1].entity_id, naruto.id);

    EXPECT_TRUE(store->vector_search(unit(4, 0), 3, EntityKind::Person).empty());

    auto unfiltered = store->vector_search(unit(4, 0), 1);
    ASSERT_EQ(unfiltered.size(), 1u);
    EXPECT_EQ(unfiltered[0].entity_id, ada.id);
}

TEST_P(PersonaStoreTest, HistoryCarriesEditorDisplayName) {
    User editor;
    editor.id = "ed-1";
    editor.username = "mycroft";
    editor.display_name = "Mycroft Holmes";
    store->add_user(editor);

    Entity e = make("Draft");
    store->update_entity(e.id, {{"name", "Final"}}, "ed-1");
    store->update_entity(e.id, {{"notes", "anonymous edit"}}, "ghost-editor");

    auto history = store->list_edit_history(e.id);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].user_id, "ghost-editor");
    EXPECT_EQ(history[0].user_display_name, "");
    EXPECT_EQ(history[1].user_id, "ed-1");
    EXPECT_EQ(history[1].user_display_name, "Mycroft Holmes");
}

TEST_P(PersonaStoreTest, UserWithoutIdGetsOne) {
    User user;
    user.username = "lestrade";
    user.display_name = "Inspector Lestrade";

    std::string id = store->add_user(user);
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(store->get_user(id).display_name, "Inspector Lestrade");

    User other;
    other.username = "gregson";
    EXPECT_NE(store->add_user(other), id);
    EXPECT_EQ(store->stats().user_count, 2);

    User clash;
    clash.username = "lestrade";
    EXPECT_THROW(store->add_user(clash), ValidationError);
}

TEST_P(PersonaStoreTest, EverySortOrderMatchesAcrossBackends) {
    Entity charlie = make("Charlie", "film");
    Entity alpha = make("Alpha", "film");
    Entity delta = make("Delta", "book");
    Entity bravo = make("Bravo", "book");
    Entity echo = make("Echo", "book");

    auto rate = [&](const Entity& e, const std::string& code) {
        Rating rating;
        rating.entity_id = e.id;
        rating.rater_id = "r";
        rating.system = "mbti";
        rating.type_code = code;
        rating.confidence = 0.5;
        store->add_rating(rating);
    };
    rate(charlie, "INTJ");
    rate(charlie, "INTP");
    rate(delta, "ENFP");
    rate(delta, "ENFJ");
    rate(alpha, "ISTJ");
    rate(echo, "ESTP");

    // Ratings never touch updated_at; this edit makes Alpha the most recent
    store->update_entity(alpha.id, {{"notes", "touched"}}, "editor");

    auto names = [&](EntitySort sort) {
        EntityQuery query;
        query.sort = sort;
        std::vector<std::string> out;
        for (const auto& e : store->list_entities(query)) {
            out.push_back(e.name);
        }
        return out;
    };

    using Names = std::vector<std::string>;
    EXPECT_EQ(names(EntitySort::NameAsc), (Names{"Alpha", "Bravo", "Charlie", "Delta", "Echo"}));
    EXPECT_EQ(names(EntitySort::NameDesc), (Names{"Echo", "Delta", "Charlie", "Bravo", "Alpha"}));
    EXPECT_EQ(names(EntitySort::Category), (Names{"Bravo", "Delta", "Echo", "Alpha", "Charlie"}));
    EXPECT_EQ(names(EntitySort::RatingCount),
              (Names{"Charlie", "Delta", "Alpha", "Echo", "Bravo"}));
    EXPECT_EQ(names(EntitySort::Recent), (Names{"Alpha", "Echo", "Bravo", "Delta", "Charlie"}));

    EntityQuery page;
    page.sort = EntitySort::RatingCount;
    page.limit = 2;
    page.offset = 1;
    auto middle = store->list_entities(page);
    ASSERT_EQ(middle.size(), 2u);
    EXPECT_EQ(middle[0].name, "Delta");
    EXPECT_EQ(middle[1].name, "Alpha");
}

INSTANTIATE_TEST_SUITE_P(Backends, PersonaStoreTest,
                         ::testing::Values(BackendKind::Sqlite, BackendKind::Fallback),
                         [](const ::testing::TestParamInfo<BackendKind>& info) {
                             return std::string(to_string(info.param));
                         });

// ==================== LIFECYCLE ====================

TEST(PersonaStoreLifecycle, OperationsBeforeInitializeThrow) {
    TempDir tmp;
    PersonaStore store(sqlite_config(tmp));

    EXPECT_EQ(store.state(), StoreState::Uninitialized);
    EXPECT_THROW(store.stats(), NotInitializedError);
    EXPECT_THROW(store.list_entities({}), NotInitializedError);
    EXPECT_THROW(store.vector_search(unit(4, 0), 1), NotInitializedError);
    EXPECT_THROW(store.backend_kind(), NotInitializedError);

    EntityDraft draft;
    draft.name = "Too early";
    EXPECT_THROW(store.create_entity(draft), NotInitializedError);
}

TEST(PersonaStoreLifecycle, UnusableSqliteFileFallsBack) {
    TempDir tmp;
    StoreConfig cfg = sqlite_config(tmp);
    cfg.sqlite_path = tmp.path().string();   // a directory, not a database file

    PersonaStore store(cfg);
    store.initialize();
    EXPECT_EQ(store.backend_kind(), BackendKind::Fallback);
}

TEST(PersonaStoreLifecycle, IndependentStoresShareNothing) {
    TempDir first_dir;
    TempDir second_dir;
    PersonaStore first(sqlite_config(first_dir));
    PersonaStore second(fallback_config(second_dir));
    first.initialize();
    second.initialize();

    EntityDraft draft;
    draft.name = "Only in first";
    first.create_entity(draft);

    EXPECT_EQ(first.stats().entity_count, 1);
    EXPECT_EQ(second.stats().entity_count, 0);
}
