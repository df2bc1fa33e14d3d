/*
 * Copyright 2014+ Evgeniy Polyakov <zbr@ioremap.net>
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

#ifndef __SWEAR_LSTRING_HPP
#define __SWEAR_LSTRING_HPP

#include <ribosome/lstring.hpp>

#include <boost/locale/utf.hpp>

#include <string>

namespace swear {

typedef ribosome::lstring lstring;
typedef unsigned int code_point;

static const code_point replacement_character = 0xfffd;

inline code_point letter_code(const lstring::value_type &l)
{
	return l.l;
}

inline lstring::value_type make_letter(code_point code)
{
	return lstring::value_type(code);
}

/*
 * One letter per code point, so offsets into the result are code point offsets.
 * Invalid or truncated sequences are decoded as U+FFFD, one letter per bad byte.
 */
inline lstring decode_utf8(const char *text, size_t size)
{
	typedef boost::locale::utf::utf_traits<char> utf8;

	lstring ret;
	ret.reserve(size);

	const char *ptr = text;
	const char *end = text + size;
	while (ptr != end) {
		const char *start = ptr;
		boost::locale::utf::code_point code = utf8::decode(ptr, end);

		if (code == boost::locale::utf::illegal || code == boost::locale::utf::incomplete) {
			ptr = start + 1;
			code = replacement_character;
		}

		ret.push_back(make_letter(code));
	}

	return ret;
}

inline lstring decode_utf8(const std::string &text)
{
	return decode_utf8(text.data(), text.size());
}

inline std::string encode_utf8(const lstring &l, size_t pos = 0, size_t len = lstring::npos)
{
	if (pos == 0 && len >= l.size())
		return ribosome::lconvert::to_string(l);

	return ribosome::lconvert::to_string(l.substr(pos, len));
}

/*
 * Lowercasing rules of one language.
 * Turkish and Azerbaijani have dotted and dotless I as separate letters: I lowercases to ı, İ to i.
 */
class casing {
public:
	casing() : m_dotted_i(false) {}
	explicit casing(const std::string &lang) : m_dotted_i(lang == "tr" || lang == "az") {}

	std::string lower(const std::string &word) const {
		if (!m_dotted_i)
			return ribosome::lconvert::string_to_lower(word);

		std::string tmp;
		tmp.reserve(word.size() + 4);

		for (size_t i = 0; i < word.size(); ++i) {
			if (word[i] == 'I') {
				tmp += "\xc4\xb1";
				continue;
			}

			if (word[i] == '\xc4' && i + 1 < word.size() && word[i + 1] == '\xb0') {
				tmp += "i";
				++i;
				continue;
			}

			tmp.push_back(word[i]);
		}

		return ribosome::lconvert::string_to_lower(tmp);
	}

private:
	bool m_dotted_i;
};

} // namespace swear

#endif /* __SWEAR_LSTRING_HPP */
