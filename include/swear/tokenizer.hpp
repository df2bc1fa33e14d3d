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

#ifndef __SWEAR_TOKENIZER_HPP
#define __SWEAR_TOKENIZER_HPP

#include "swear/charset.hpp"
#include "swear/lstring.hpp"

#include <string>
#include <vector>

namespace swear {

struct token {
	std::string	text;		// lowercase, used for matching
	std::string	original;	// exactly text[start, end) of the input
	size_t		index = 0;
	size_t		start = 0;	// offsets are in letters (code points)
	size_t		end = 0;
};

/*
 * Splits text on whitespace, then strips boundary punctuation from both edges
 * of every chunk. Punctuation inside a chunk is part of the word.
 * Chunks which consist of punctuation only do not produce tokens.
 */
class tokenizer {
public:
	tokenizer() : m_spaces(whitespace()), m_punct(boundary_punctuation()) {}

	// words are lowercased with the rules of @lang
	explicit tokenizer(const std::string &lang) :
		m_spaces(whitespace()), m_punct(boundary_punctuation()), m_casing(lang) {}

	tokenizer(const charset &spaces, const charset &punct) : m_spaces(spaces), m_punct(punct) {}

	std::vector<token> tokenize(const std::string &text) const {
		return tokenize(decode_utf8(text));
	}

	std::vector<token> tokenize(const lstring &text) const {
		std::vector<token> ret;

		size_t pos = 0;
		while (pos < text.size()) {
			while (pos < text.size() && m_spaces.has(letter_code(text[pos])))
				++pos;

			size_t chunk_end = pos;
			while (chunk_end < text.size() && !m_spaces.has(letter_code(text[chunk_end])))
				++chunk_end;

			size_t start = pos;
			size_t end = chunk_end;

			while (start < end && m_punct.has(letter_code(text[start])))
				++start;
			while (end > start && m_punct.has(letter_code(text[end - 1])))
				--end;

			if (start < end) {
				token t;
				t.original = encode_utf8(text, start, end - start);
				t.text = m_casing.lower(t.original);
				t.index = ret.size();
				t.start = start;
				t.end = end;

				ret.emplace_back(std::move(t));
			}

			pos = chunk_end;
		}

		return ret;
	}

	// lowercase words only, the way dictionary entries are normalized
	std::vector<std::string> words(const std::string &text) const {
		std::vector<std::string> ret;

		auto tokens = tokenize(text);
		ret.reserve(tokens.size());
		for (auto &t: tokens) {
			ret.emplace_back(std::move(t.text));
		}

		return ret;
	}

private:
	charset m_spaces;
	charset m_punct;
	casing m_casing;
};

} // namespace swear

#endif /* __SWEAR_TOKENIZER_HPP */
