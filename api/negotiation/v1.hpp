#pragma once

#include "negotiation/v1/types.pb.h"
#include "negotiation/v1/messages.pb.h"
