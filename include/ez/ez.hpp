// include/ez/ez.hpp
#pragma once

#include "ez/grapheme.hpp"
#include "ez/pattern.hpp"
#include "ez/ez_string.hpp"
#include "ez/grapheme_match.hpp"
#include "ez/errors.hpp"
#include "ez/unicode/unicode_utils.hpp"
#include "ez/runtime/settings.hpp"
