#pragma once

#include <ribosome/error.hpp>

#include <errno.h>

namespace swear { namespace error {

enum {
	// there is no word list for requested or detected language
	unsupported_language = -ENOTSUP,
	// text sample does not score positively for any language
	detection_failed = -ENODATA,
	file_not_found = -ENOENT,
	parse_error = -EINVAL,
	// check or censor has been called before any language was selected
	language_not_set = -ENOEXEC,
	// censor mask character which can be a part of a word
	invalid_mask = -EDOM,
};

}} // namespace swear::error
