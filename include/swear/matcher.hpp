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

#ifndef __SWEAR_MATCHER_HPP
#define __SWEAR_MATCHER_HPP

#include "swear/tokenizer.hpp"
#include "swear/vocabulary.hpp"

#include <msgpack.hpp>

#include <string>
#include <vector>

namespace swear {

struct match_record {
	std::string	term;		// spelling from the word list
	size_t		index = 0;	// index of the first matched token
	size_t		start = 0;
	size_t		end = 0;
	std::string	text;		// matched span as it is written in the input

	MSGPACK_DEFINE(term, index, start, end, text);
};

class matcher {
public:
	/*
	 * Greedy leftmost scan: at every token the longest term starting there wins,
	 * its tokens are consumed, so records never overlap and come in text order.
	 */
	static std::vector<match_record> match(const std::vector<token> &tokens, const vocabulary &voc) {
		std::vector<match_record> ret;

		if (voc.empty())
			return ret;

		const auto &root = voc.phrases();
		const size_t max_words = voc.max_words();

		size_t i = 0;
		while (i < tokens.size()) {
			const trie::node<size_t> *n = &root;
			const trie::node<size_t> *found = NULL;
			size_t found_len = 0;

			for (size_t len = 1; len <= max_words && i + len <= tokens.size(); ++len) {
				n = n->next(tokens[i + len - 1].text);
				if (!n)
					break;

				if (n->terminal()) {
					found = n;
					found_len = len;
				}
			}

			if (!found) {
				++i;
				continue;
			}

			const auto &first = tokens[i];
			const auto &last = tokens[i + found_len - 1];

			match_record rec;
			rec.term = voc.terms()[found->data()].spelling;
			rec.index = first.index;
			rec.start = first.start;
			rec.end = last.end;
			rec.text = span(tokens, i, found_len);

			ret.emplace_back(std::move(rec));
			i += found_len;
		}

		return ret;
	}

	// the same, but matched text is copied from the input with its original spacing
	static std::vector<match_record> match(const lstring &text, const vocabulary &voc) {
		auto ret = match(voc.get_tokenizer().tokenize(text), voc);
		for (auto &rec: ret) {
			rec.text = encode_utf8(text, rec.start, rec.end - rec.start);
		}

		return ret;
	}

	static std::vector<match_record> match(const std::string &text, const vocabulary &voc) {
		return match(decode_utf8(text), voc);
	}

private:
	// whitespace between tokens is not known here, words are joined with a single space
	static std::string span(const std::vector<token> &tokens, size_t pos, size_t num) {
		std::string ret = tokens[pos].original;
		for (size_t i = pos + 1; i < pos + num; ++i) {
			ret += " ";
			ret += tokens[i].original;
		}

		return ret;
	}
};

} // namespace swear

#endif /* __SWEAR_MATCHER_HPP */
