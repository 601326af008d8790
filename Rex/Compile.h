
#ifndef REX_COMPILE_H_
#define REX_COMPILE_H_

#include "Pattern.h"

#include <string_view>

namespace Rex {

Pattern compilePattern(std::string_view exp);

}

#endif
