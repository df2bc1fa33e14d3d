#pragma once

#include "swear/censor.hpp"
#include "swear/detector.hpp"
#include "swear/error.hpp"
#include "swear/matcher.hpp"
#include "swear/store.hpp"

#include <ribosome/error.hpp>

#include <string>
#include <vector>

namespace swear {

/*
 * Check/censor session bound to one selected language.
 * Store must outlive the session, vocabularies are shared with the store cache.
 */
class filter {
public:
	filter(store &st) : m_store(st), m_detector(st) {}

	// throws if @lang can not be selected
	filter(store &st, const std::string &lang) : m_store(st), m_detector(st) {
		auto err = set_language(lang);
		if (err)
			ribosome::throw_error(err.code(), "%s", err.message().c_str());
	}

	ribosome::error_info set_language(const std::string &lang) {
		vocabulary_t voc;
		auto err = m_store.load(lang, &voc);
		if (err)
			return err;

		m_voc = voc;
		return ribosome::error_info();
	}

	ribosome::error_info set_language_from_text(const std::string &text, std::string *lang) {
		std::string detected;
		auto err = m_detector.detect(text, &detected);
		if (err)
			return err;

		err = set_language(detected);
		if (err)
			return err;

		*lang = detected;
		return ribosome::error_info();
	}

	ribosome::error_info set_language_from_subtitle_file(const std::string &path, size_t cues, std::string *lang) {
		std::string detected;
		auto err = m_detector.detect_subtitle_file(path, cues, &detected);
		if (err)
			return err;

		err = set_language(detected);
		if (err)
			return err;

		*lang = detected;
		return ribosome::error_info();
	}

	ribosome::error_info set_language_from_subtitle_file(const std::string &path, std::string *lang) {
		return set_language_from_subtitle_file(path, detector::default_cues, lang);
	}

	// empty if nothing has been selected yet
	std::string language() const {
		if (!m_voc)
			return std::string();

		return m_voc->language();
	}

	ribosome::error_info set_mask(code_point mask) {
		if (!swear::censor::valid_mask(mask)) {
			return ribosome::create_error(error::invalid_mask,
					"mask character U+%04X is not punctuation, censored text could be matched again", mask);
		}

		m_censor = swear::censor(mask);
		return ribosome::error_info();
	}

	ribosome::error_info check(const std::string &text, std::vector<match_record> *ret) const {
		if (!m_voc) {
			return ribosome::create_error(error::language_not_set, "language is not set");
		}

		*ret = matcher::match(text, *m_voc);
		return ribosome::error_info();
	}

	ribosome::error_info censor(const std::string &text, std::string *ret) const {
		if (!m_voc) {
			return ribosome::create_error(error::language_not_set, "language is not set");
		}

		lstring lt = decode_utf8(text);
		auto records = matcher::match(lt, *m_voc);

		*ret = encode_utf8(m_censor.apply(lt, records));
		return ribosome::error_info();
	}

	detector &get_detector() {
		return m_detector;
	}

private:
	store &m_store;
	detector m_detector;
	swear::censor m_censor;
	vocabulary_t m_voc;
};

} // namespace swear
