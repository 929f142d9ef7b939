// 基础库总头文件
#pragma once

#include "logging.hpp"
#include "misc.hpp"
#include "stream.hpp"
#include "xwrap.hpp"
