#include "color.h"

namespace xpathq::cli {

Color kColor;

}  // namespace xpathq::cli
