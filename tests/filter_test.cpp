#include "swear/filter.hpp"

#include "temp_dir.hpp"

#include <gtest/gtest.h>

using namespace swear;

TEST(filter, language_must_be_selected_first)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);

	EXPECT_EQ(f.language(), "");

	std::vector<match_record> records;
	auto err = f.check("what the fuck", &records);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::language_not_set);

	std::string out;
	err = f.censor("what the fuck", &out);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::language_not_set);
}

TEST(filter, failed_selection_keeps_previous_language)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);

	ASSERT_FALSE(f.set_language("en"));
	EXPECT_EQ(f.language(), "en");

	auto err = f.set_language("xx");
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::unsupported_language);
	EXPECT_EQ(f.language(), "en");

	std::string lang = "unchanged";
	err = f.set_language_from_text("", &lang);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::detection_failed);
	EXPECT_EQ(lang, "unchanged");
	EXPECT_EQ(f.language(), "en");

	err = f.set_language_from_subtitle_file("/nonexistent/movie.srt", &lang);
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::file_not_found);
	EXPECT_EQ(f.language(), "en");
}

TEST(filter, check_and_censor_english)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);

	std::string lang;
	auto err = f.set_language_from_text("This is a perfectly normal English sentence.", &lang);
	ASSERT_FALSE(err) << err.message();
	EXPECT_EQ(lang, "en");
	EXPECT_EQ(f.language(), "en");

	std::string text = "what the fuck is this shit";

	std::vector<match_record> records;
	err = f.check(text, &records);
	ASSERT_FALSE(err) << err.message();
	ASSERT_EQ(records.size(), 2U);

	EXPECT_EQ(records[0].term, "fuck");
	EXPECT_EQ(records[0].index, 2U);
	EXPECT_EQ(records[0].start, 9U);
	EXPECT_EQ(records[0].end, 13U);

	EXPECT_EQ(records[1].term, "shit");
	EXPECT_EQ(records[1].index, 5U);
	EXPECT_EQ(records[1].start, 22U);
	EXPECT_EQ(records[1].end, 26U);

	std::string out;
	err = f.censor(text, &out);
	ASSERT_FALSE(err) << err.message();
	EXPECT_EQ(out, "what the *** is this ***");

	err = f.check(out, &records);
	ASSERT_FALSE(err);
	EXPECT_TRUE(records.empty());
}

TEST(filter, phrase_is_reported_once)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);
	ASSERT_FALSE(f.set_language("en"));

	std::vector<match_record> records;
	ASSERT_FALSE(f.check("You son of a bitch!", &records));
	ASSERT_EQ(records.size(), 1U);
	EXPECT_EQ(records[0].term, "son of a bitch");

	std::string out;
	ASSERT_FALSE(f.censor("You son of a bitch!", &out));
	EXPECT_EQ(out, "You ***!");
}

TEST(filter, clean_text_is_unchanged)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);
	ASSERT_FALSE(f.set_language("en"));

	std::vector<match_record> records;
	ASSERT_FALSE(f.check("have a nice day", &records));
	EXPECT_TRUE(records.empty());

	std::string out;
	ASSERT_FALSE(f.censor("have a nice day", &out));
	EXPECT_EQ(out, "have a nice day");
}

TEST(filter, turkish_text)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);

	std::string text = "Siktir git lan, bu ak\xc5\x9f" "am \xc3\xa7ok g\xc3\xbczel";

	std::string lang;
	auto err = f.set_language_from_text(text, &lang);
	ASSERT_FALSE(err) << err.message();
	EXPECT_EQ(lang, "tr");

	std::vector<match_record> records;
	ASSERT_FALSE(f.check(text, &records));
	ASSERT_EQ(records.size(), 1U);
	EXPECT_EQ(records[0].term, "siktir git");
	EXPECT_EQ(records[0].index, 0U);
	EXPECT_EQ(records[0].start, 0U);
	EXPECT_EQ(records[0].end, 10U);
	EXPECT_EQ(records[0].text, "Siktir git");

	std::string out;
	ASSERT_FALSE(f.censor(text, &out));
	EXPECT_EQ(out, "*** lan, bu ak\xc5\x9f" "am \xc3\xa7ok g\xc3\xbczel");
}

TEST(filter, language_from_subtitle_file)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);

	test::temp_dir tmp;
	std::string path = tmp.write("film.srt",
			"1\n"
			"00:00:01,000 --> 00:00:03,000\n"
			"Eu n\xc3\xa3o sei onde est\xc3\xa1 o meu livro,\n"
			"mas ele estava aqui ontem.\n"
			"\n"
			"2\n"
			"00:00:04,000 --> 00:00:05,000\n"
			"Porra!\n");

	std::string lang;
	auto err = f.set_language_from_subtitle_file(path, &lang);
	ASSERT_FALSE(err) << err.message();
	EXPECT_EQ(lang, "pt");
	EXPECT_EQ(f.language(), "pt");

	std::string out;
	ASSERT_FALSE(f.censor("Porra, que merda!", &out));
	EXPECT_EQ(out, "***, que ***!");
}

TEST(filter, custom_mask)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st);
	ASSERT_FALSE(f.set_language("de"));

	ASSERT_FALSE(f.set_mask(U'#'));

	std::string out;
	ASSERT_FALSE(f.censor("So ein Mist!", &out));
	EXPECT_EQ(out, "So ein ###!");
}

TEST(filter, sessions_share_store)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter en(st), es(st);

	ASSERT_FALSE(en.set_language("en"));
	ASSERT_FALSE(es.set_language("es"));

	std::vector<match_record> records;
	ASSERT_FALSE(en.check("mierda", &records));
	EXPECT_TRUE(records.empty());

	ASSERT_FALSE(es.check("mierda", &records));
	ASSERT_EQ(records.size(), 1U);
	EXPECT_EQ(records[0].term, "mierda");
}

TEST(filter, mask_which_can_form_a_word_is_rejected)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st, "en");

	auto err = f.set_mask(U'x');
	ASSERT_TRUE(err);
	EXPECT_EQ(err.code(), error::invalid_mask);

	// previous mask is kept
	std::string out;
	ASSERT_FALSE(f.censor("oh shit", &out));
	EXPECT_EQ(out, "oh ***");
}

TEST(filter, language_selected_at_construction)
{
	store st(SWEAR_TEST_DATA_DIR);

	filter f(st, "tr");
	EXPECT_EQ(f.language(), "tr");

	std::vector<match_record> records;
	ASSERT_FALSE(f.check("siktir", &records));
	EXPECT_EQ(records.size(), 1U);

	EXPECT_THROW(filter bad(st, "xx"), std::exception);
}

TEST(filter, uppercase_turkish_is_censored)
{
	store st(SWEAR_TEST_DATA_DIR);
	filter f(st, "tr");

	const char *texts[] = {
		"AMINA KOYAYIM",
		"\xc5\x9e" "EREFS\xc4\xb0Z",
		"S\xc4\xb0KT\xc4\xb0R G\xc4\xb0T",
	};

	for (auto text: texts) {
		std::vector<match_record> records;
		ASSERT_FALSE(f.check(text, &records));
		EXPECT_EQ(records.size(), 1U) << text;

		std::string out;
		ASSERT_FALSE(f.censor(text, &out));
		EXPECT_EQ(out, "***") << text;
	}
}
