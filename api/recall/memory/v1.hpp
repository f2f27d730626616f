#pragma once

#include "recall/memory/v1/contract.pb.h"
#include "recall/memory/v1/types.pb.h"
