
#ifndef REX_SUBSTITUTE_H_
#define REX_SUBSTITUTE_H_

#include "Execute.h"

#include <string>
#include <string_view>

namespace Rex {

std::string expandTemplate(std::string_view repl, std::string_view text, const GroupSpans &groups);

}

#endif
