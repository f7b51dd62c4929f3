#pragma once

// 单头文件入口：普通 MPMC 通道 + 覆盖发送通道
#include "evc/channel/itc.hpp"
#include "evc/channel/overwrite.hpp"
#include "evc/core/error.hpp"
#include "evc/types.hpp"
