#include <gtest/gtest.h>

#include <string>

#include "food_corpus.hpp"
#include "model_io.hpp"
#include "temp_dir.hpp"

using bayestext::json;
using bayestext::NaiveBayesModel;

namespace {

NaiveBayesModel food_model(bool train) {
    NaiveBayesModel nb;
    nb.add_documents(food_documents());
    if (train) nb.train();
    return nb;
}

} // namespace

TEST(ModelIO, JsonCarriesCounts) {
    auto nb = food_model(true);
    json j = bayestext::model_to_json(nb);

    EXPECT_EQ(j["format"].get<std::string>(), bayestext::MODEL_FORMAT);
    EXPECT_EQ(j["version"].get<int>(), bayestext::MODEL_FORMAT_VERSION);
    EXPECT_TRUE(j["trained"].get<bool>());
    EXPECT_DOUBLE_EQ(j["smoothing"].get<double>(), 1.0);
    ASSERT_TRUE(j["classes"].contains("meat"));
    EXPECT_EQ(j["classes"]["meat"]["documents"].get<int>(), 2);
    EXPECT_EQ(j["classes"]["meat"]["tokens"].get<uint64_t>(), nb.class_stats("meat")->num_tokens);
    EXPECT_EQ(j["classes"]["meat"]["words"]["pancetta"].get<int>(), 3);
}

TEST(ModelIO, RoundTripRebuildsIdenticalTables) {
    auto nb = food_model(true);

    NaiveBayesModel back;
    ASSERT_TRUE(bayestext::model_from_json(bayestext::model_to_json(nb), back));
    ASSERT_TRUE(back.trained());
    EXPECT_EQ(back.labels(), nb.labels());
    EXPECT_EQ(back.vocabulary_size(), nb.vocabulary_size());
    EXPECT_EQ(back.total_documents(), nb.total_documents());
    EXPECT_EQ(back.classify("salami pancetta beef ribs"), "meat");

    for (const auto& l : nb.labels()) {
        const auto* a = nb.probability_table(l);
        const auto* b = back.probability_table(l);
        ASSERT_NE(b, nullptr);
        EXPECT_DOUBLE_EQ(a->log_prior, b->log_prior);
        for (const auto& kv : a->log_likelihood) EXPECT_DOUBLE_EQ(b->log_likelihood.at(kv.first), kv.second);
    }
}

TEST(ModelIO, UntrainedModelStaysUntrained) {
    auto nb = food_model(false);
    nb.add_document("tofu tempeh", "veggie");

    NaiveBayesModel back;
    ASSERT_TRUE(bayestext::model_from_json(bayestext::model_to_json(nb), back));
    EXPECT_FALSE(back.trained());
    EXPECT_EQ(back.total_documents(), 5u);

    // still accepting documents
    back.add_document("brisket", "meat");
    back.train();
    EXPECT_EQ(back.classify("brisket"), "meat");
}

TEST(ModelIO, KeepsSmoothing) {
    NaiveBayesModel nb(0.1);
    nb.add_documents(food_documents());
    nb.train();

    NaiveBayesModel back;
    ASSERT_TRUE(bayestext::model_from_json(bayestext::model_to_json(nb), back));
    EXPECT_DOUBLE_EQ(back.smoothing(), 0.1);
    EXPECT_EQ(back.classify("salami pancetta beef ribs"), "meat");
}

TEST(ModelIO, RejectsMalformedDocuments) {
    const json good = bayestext::model_to_json(food_model(true));
    NaiveBayesModel out;

    EXPECT_FALSE(bayestext::model_from_json(json::array(), out));

    json bad = good;
    bad["format"] = "something-else";
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["version"] = 2;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["version"] = "1";
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad.erase("classes");
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["smoothing"] = 0.0;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["documents"] = 0;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["words"]["beef"] = "two";
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["tokens"] = 1;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["documents"] = -1;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["documents"] = 2.5;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["documents"] = 4294967296ULL;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["words"]["beef"] = -2;
    bad["classes"]["meat"]["tokens"] = good["classes"]["meat"]["tokens"].get<int64_t>() - 4;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["words"]["beef"] = 1.5;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    bad = good;
    bad["classes"]["meat"]["documents"] = 4294967295ULL;
    EXPECT_FALSE(bayestext::model_from_json(bad, out));

    // target untouched on failure
    EXPECT_FALSE(out.trained());
    EXPECT_TRUE(out.labels().empty());
}

TEST(ModelIO, AcceptsCountsParsedFromText) {
    NaiveBayesModel nb;
    ASSERT_TRUE(bayestext::model_from_json(json::parse(R"({
        "format": "bayestext-model", "version": 1, "smoothing": 1.0, "trained": true,
        "classes": {
            "x": {"documents": 1, "tokens": 3, "words": {"a": 2, "b": 1}},
            "y": {"documents": 1, "tokens": 1, "words": {"c": 1}}
        }
    })"), nb));
    EXPECT_EQ(nb.total_documents(), 2u);
    EXPECT_EQ(nb.classify("a"), "x");
    EXPECT_EQ(nb.classify("c"), "y");
    for (const auto& l : nb.labels()) EXPECT_LT(nb.probability_table(l)->log_prior, 0.0);
}

TEST(ModelIO, SaveAndLoadFile) {
    TempDir tmp;
    fs::path p = tmp.path / "nested" / "model.json";

    ASSERT_TRUE(bayestext::save_model(p, food_model(true)));
    ASSERT_TRUE(fs::exists(p));

    NaiveBayesModel back;
    ASSERT_TRUE(bayestext::load_model(p, back));
    EXPECT_EQ(back.classify("salami pancetta beef ribs"), "meat");
    EXPECT_EQ(back.classify(""), "meat");
}

TEST(ModelIO, LoadFailures) {
    TempDir tmp;
    NaiveBayesModel nb;

    EXPECT_FALSE(bayestext::load_model(tmp.path / "missing.json", nb));
    EXPECT_NO_THROW(EXPECT_FALSE(bayestext::load_model(tmp.write("plain.txt", "x") / "below.json", nb)));
    EXPECT_FALSE(bayestext::load_model(tmp.write("broken.json", "{ not json"), nb));
    EXPECT_FALSE(bayestext::load_model(tmp.write("other.json", R"({"format":"x"})"), nb));
}
