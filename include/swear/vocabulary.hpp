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

#ifndef __SWEAR_VOCABULARY_HPP
#define __SWEAR_VOCABULARY_HPP

#include "swear/tokenizer.hpp"
#include "swear/trie.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace swear {

struct term {
	std::string			spelling;	// the line as it is written in the list
	std::vector<std::string>	words;		// normalized, never empty
};

class vocabulary {
public:
	vocabulary(const std::string &language) : m_language(language), m_tokenizer(language), m_max_words(0) {}

	const std::string &language() const {
		return m_language;
	}

	// returns false for lines without words and for repeated terms
	bool add_term(const std::string &line) {
		term t;
		t.spelling = line;
		t.words = m_tokenizer.words(line);
		if (t.words.empty())
			return false;

		if (!m_phrases.add(t.words, m_terms.size()))
			return false;

		if (t.words.size() == 1)
			m_reference.insert(t.words[0]);

		m_max_words = std::max(m_max_words, t.words.size());
		m_terms.emplace_back(std::move(t));
		return true;
	}

	// every word of the line is added, so phrases are fine here too
	void add_reference(const std::string &line) {
		for (auto &w: m_tokenizer.words(line)) {
			m_reference.insert(std::move(w));
		}
	}

	const std::vector<term> &terms() const {
		return m_terms;
	}

	const trie::node<size_t> &phrases() const {
		return m_phrases;
	}

	size_t max_words() const {
		return m_max_words;
	}

	bool empty() const {
		return m_terms.empty();
	}

	// stop words and single-word terms, used to score language of a sample
	bool is_reference(const std::string &word) const {
		return m_reference.find(word) != m_reference.end();
	}

	size_t reference_size() const {
		return m_reference.size();
	}

	const tokenizer &get_tokenizer() const {
		return m_tokenizer;
	}

private:
	std::string m_language;
	tokenizer m_tokenizer;

	std::vector<term> m_terms;
	trie::node<size_t> m_phrases;
	size_t m_max_words;

	std::set<std::string> m_reference;
};

} // namespace swear

#endif /* __SWEAR_VOCABULARY_HPP */
