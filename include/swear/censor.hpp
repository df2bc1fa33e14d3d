#pragma once

#include "swear/charset.hpp"
#include "swear/lstring.hpp"
#include "swear/matcher.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace swear {

class censor {
public:
	enum {
		mask_size = 3,
	};

	censor() : m_mask(mask_size, make_letter('*')) {}

	// @mask must pass valid_mask(), otherwise censored text can be matched again
	explicit censor(code_point mask) : m_mask(mask_size, make_letter(mask)) {}

	// only boundary punctuation never becomes part of a word
	static bool valid_mask(code_point mask) {
		return boundary_punctuation().has(mask);
	}

	const lstring &mask() const {
		return m_mask;
	}

	/*
	 * Every record's span is replaced with the mask, text between records is copied.
	 * Records which overlap already replaced span or do not fit into the text are skipped.
	 */
	lstring apply(const lstring &text, const std::vector<match_record> &records) const {
		std::vector<const match_record *> sorted;
		sorted.reserve(records.size());
		for (const auto &rec: records) {
			sorted.push_back(&rec);
		}

		std::stable_sort(sorted.begin(), sorted.end(), [] (const match_record *r1, const match_record *r2) {
					return r1->start < r2->start;
				});

		lstring ret;
		ret.reserve(text.size());

		size_t pos = 0;
		for (auto rec: sorted) {
			if (rec->start < pos || rec->start >= rec->end || rec->end > text.size())
				continue;

			ret.append(text, pos, rec->start - pos);
			ret.append(m_mask);
			pos = rec->end;
		}

		ret.append(text, pos, lstring::npos);
		return ret;
	}

	std::string apply(const std::string &text, const std::vector<match_record> &records) const {
		return encode_utf8(apply(decode_utf8(text), records));
	}

private:
	lstring m_mask;
};

} // namespace swear
