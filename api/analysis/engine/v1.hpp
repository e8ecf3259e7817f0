#pragma once

#include "analysis/engine/v1/task.pb.h"
#include "analysis/engine/v1/dataset.pb.h"
#include "analysis/engine/v1/result.pb.h"

#include "analysis/engine/v1/broker_service.pb.h"
#include "analysis/engine/v1/broker_service.grpc.pb.h"
