#pragma once

#include "woki/v1/types.pb.h"
#include "woki/v1/booking.pb.h"
