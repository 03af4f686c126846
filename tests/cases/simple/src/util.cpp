#include "util.h"

int util_answer() { return 42; }
