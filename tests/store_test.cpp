#include "swear/store.hpp"

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace swear;

TEST(store, loads_terms_and_skips_empty_lines)
{
	test::temp_dir tmp;
	tmp.language("en",
			"# comment\n"
			"Bad\n"
			"\n"
			"   \n"
			"  bad   WORD \r\n"
			"bad\n"
			"...\n",
			"the\nis\n");

	store st(tmp.path());

	vocabulary_t voc;
	auto err = st.load("en", &voc);
	ASSERT_FALSE(err) << err.message();
	ASSERT_TRUE(voc != nullptr);

	EXPECT_EQ(voc->language(), "en");
	ASSERT_EQ(voc->terms().size(), 2U);

	EXPECT_EQ(voc->terms()[0].spelling, "Bad");
	EXPECT_EQ(voc->terms()[0].words, std::vector<std::string>({"bad"}));
	EXPECT_EQ(voc->terms()[1].spelling, "bad   WORD");
	EXPECT_EQ(voc->terms()[1].words, std::vector<std::string>({"bad", "word"}));

	EXPECT_EQ(voc->max_words(), 2U);

	EXPECT_TRUE(voc->is_reference("the"));
	EXPECT_TRUE(voc->is_reference("is"));
	EXPECT_TRUE(voc->is_reference("bad"));
	EXPECT_FALSE(voc->is_reference("word"));
}

TEST(store, loading_is_cached)
{
	test::temp_dir tmp;
	tmp.language("tr", "siktir\n");

	store st(tmp.path());

	vocabulary_t v1, v2;
	ASSERT_FALSE(st.load("tr", &v1));
	ASSERT_FALSE(st.load("tr", &v2));

	EXPECT_EQ(v1.get(), v2.get());
	EXPECT_EQ(v1->reference_size(), 1U);
}

TEST(store, unknown_language_is_unsupported)
{
	test::temp_dir tmp;
	tmp.language("en", "bad\n");

	store st(tmp.path());

	vocabulary_t voc;
	auto err = st.load("xx", &voc);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::unsupported_language);
	EXPECT_TRUE(voc == nullptr);

	EXPECT_FALSE(st.is_supported("xx"));
	EXPECT_TRUE(st.is_supported("tr"));
}

TEST(store, language_without_word_list_is_unsupported)
{
	test::temp_dir tmp;
	tmp.language("en", "bad\n");

	store st(tmp.path());

	vocabulary_t voc;
	auto err = st.load("de", &voc);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::unsupported_language);
}

TEST(store, supported_languages_come_in_priority_order)
{
	store st("/nonexistent");

	std::vector<std::string> expected({"en", "tr", "de", "es", "pt"});
	EXPECT_EQ(st.supported(), expected);

	store::options opts;
	opts.languages = {"pt", "en"};
	store custom("/nonexistent", opts);
	EXPECT_EQ(custom.supported(), std::vector<std::string>({"pt", "en"}));
	EXPECT_FALSE(custom.is_supported("tr"));
}

TEST(store, inserted_vocabulary_is_used_instead_of_files)
{
	store st("/nonexistent");

	std::shared_ptr<vocabulary> voc = std::make_shared<vocabulary>("xx");
	EXPECT_TRUE(voc->add_term("darn"));
	st.insert(voc);

	EXPECT_TRUE(st.is_supported("xx"));

	vocabulary_t loaded;
	ASSERT_FALSE(st.load("xx", &loaded));
	EXPECT_EQ(loaded.get(), voc.get());
}

TEST(store, shipped_word_lists_load)
{
	store st(SWEAR_TEST_DATA_DIR);

	for (const auto &lang: st.supported()) {
		vocabulary_t voc;
		auto err = st.load(lang, &voc);
		ASSERT_FALSE(err) << lang << ": " << err.message();
		EXPECT_FALSE(voc->empty()) << lang;
		EXPECT_GT(voc->max_words(), 1U) << lang;
		EXPECT_GT(voc->reference_size(), voc->terms().size()) << lang;
	}
}

TEST(store, supported_list_is_a_snapshot)
{
	store st("/nonexistent");

	std::thread writer([&] () {
		for (int i = 0; i < 200; ++i) {
			st.insert(std::make_shared<vocabulary>("x" + std::to_string(i)));
		}
	});

	for (int i = 0; i < 200; ++i) {
		auto langs = st.supported();
		EXPECT_GE(langs.size(), 5U);
		EXPECT_EQ(langs.front(), "en");
		EXPECT_TRUE(st.is_supported("pt"));
	}

	writer.join();

	auto langs = st.supported();
	ASSERT_EQ(langs.size(), 205U);
	EXPECT_EQ(langs[4], "pt");
	EXPECT_EQ(langs[5], "x0");
	EXPECT_EQ(langs.back(), "x199");
}
