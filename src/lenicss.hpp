#ifndef SEEN_LENICSS_H
#define SEEN_LENICSS_H

#include "lexer/lexer.hpp"
#include "lexer/tokenizer.hpp"
#include "models/line.hpp"
#include "models/models_fwd.hpp"
#include "models/token.hpp"
#include "utils/format/css_viewer.hpp"

#endif
