/*
 * Copyright 2013+ Evgeniy Polyakov <zbr@ioremap.net>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef __SWEAR_DETECTOR_HPP
#define __SWEAR_DETECTOR_HPP

#include "swear/error.hpp"
#include "swear/store.hpp"
#include "swear/subtitle.hpp"
#include "swear/tokenizer.hpp"

#include <ribosome/error.hpp>

#include <string>
#include <utility>
#include <vector>

namespace swear {

typedef std::pair<std::string, size_t> language_score;

/*
 * Language of a sample is the one whose reference vocabulary contains
 * the most of the sample's words. Ties go to the language which comes
 * first in the store's language list.
 */
class detector {
public:
	enum {
		default_cues = 10,
	};

	detector(store &st) : m_store(st) {}

	/*
	 * Scores of every supported language, in priority order.
	 * Every language lowercases the text with its own rules before words are looked up.
	 */
	ribosome::error_info scores(const std::string &text, std::vector<language_score> *ret) {
		std::vector<language_score> sc;

		for (const auto &lang: m_store.supported()) {
			vocabulary_t voc;
			auto err = m_store.load(lang, &voc);
			if (err)
				return err;

			size_t score = 0;
			for (const auto &w: voc->get_tokenizer().words(text)) {
				if (voc->is_reference(w))
					score++;
			}

			sc.emplace_back(lang, score);
		}

		ret->swap(sc);
		return ribosome::error_info();
	}

	ribosome::error_info detect(const std::string &text, std::string *lang) {
		size_t words = m_tokenizer.tokenize(text).size();
		if (words == 0) {
			return ribosome::create_error(error::detection_failed, "could not detect language: text has no words");
		}

		std::vector<language_score> sc;
		auto err = scores(text, &sc);
		if (err)
			return err;

		size_t max_score = 0;
		std::string name;

		for (const auto &p: sc) {
			if (p.second > max_score) {
				max_score = p.second;
				name = p.first;
			}
		}

		if (max_score == 0) {
			return ribosome::create_error(error::detection_failed,
					"could not detect language: none of %zu words is known to any language", words);
		}

		*lang = name;
		return ribosome::error_info();
	}

	// only first @cues cues of the file are used as a sample
	ribosome::error_info detect_subtitle_file(const std::string &path, size_t cues, std::string *lang) {
		subtitle sub;
		auto err = sub.parse_file(path);
		if (err)
			return err;

		return detect(sub.sample(cues), lang);
	}

	ribosome::error_info detect_subtitle_file(const std::string &path, std::string *lang) {
		return detect_subtitle_file(path, default_cues, lang);
	}

private:
	store &m_store;
	tokenizer m_tokenizer;
};

} // namespace swear

#endif /* __SWEAR_DETECTOR_HPP */
