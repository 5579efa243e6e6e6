#pragma once

#include "berth/engine/v1/types.pb.h"
#include "berth/engine/v1/engine_service.pb.h"
#include "berth/engine/v1/engine_service.grpc.pb.h"

#include "berth/machine/v1/machine.pb.h"
