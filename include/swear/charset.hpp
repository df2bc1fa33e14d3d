#pragma once

#include "swear/lstring.hpp"

#include <initializer_list>
#include <string>
#include <unordered_set>

namespace swear {

static const std::string ascii_punctuation = "`~!@#$%^&*()_+-=[]\\{}|;':\",./<>?";
static const std::string ascii_spaces = " \t\n\r\v\f";

class charset {
public:
	charset() {}

	charset(const std::string &chars) {
		for (const auto &ch: decode_utf8(chars)) {
			m_set.insert(letter_code(ch));
		}
	}

	charset(std::initializer_list<code_point> chars) {
		for (auto ch: chars) {
			m_set.insert(ch);
		}
	}

	void add(std::initializer_list<code_point> chars) {
		for (auto ch: chars) {
			m_set.insert(ch);
		}
	}

	bool has(code_point ch) const {
		return m_set.find(ch) != m_set.end();
	}

	bool empty() const {
		return m_set.empty();
	}

private:
	std::unordered_set<code_point> m_set;
};

// everything the tokenizer splits words on
inline charset whitespace()
{
	charset ret(ascii_spaces);
	ret.add({
		0x0085, 0x00a0, 0x1680,
		0x2000, 0x2001, 0x2002, 0x2003, 0x2004, 0x2005,
		0x2006, 0x2007, 0x2008, 0x2009, 0x200a,
		0x2028, 0x2029, 0x202f, 0x205f, 0x3000,
	});
	return ret;
}

// characters stripped from the edges of a word, inner ones are kept
inline charset boundary_punctuation()
{
	charset ret(ascii_punctuation);
	ret.add({
		0x00a1, 0x00ab, 0x00b7, 0x00bb, 0x00bf,
		0x2010, 0x2011, 0x2012, 0x2013, 0x2014, 0x2015,
		0x2018, 0x2019, 0x201a, 0x201b, 0x201c, 0x201d, 0x201e, 0x201f,
		0x2022, 0x2026, 0x2039, 0x203a,
		0x3001, 0x3002, 0xff01, 0xff0c, 0xff0e, 0xff1f,
	});
	return ret;
}

} // namespace swear
