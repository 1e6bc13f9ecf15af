#pragma once

#include "refstore/v1/reference.pb.h"
#include "refstore/v1/reference_service.pb.h"
