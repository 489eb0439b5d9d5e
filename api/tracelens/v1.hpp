#pragma once

#include "tracelens/v1/telemetry.pb.h"
#include "tracelens/v1/reports.pb.h"

#include "tracelens/v1/trace_service.pb.h"
#include "tracelens/v1/statistics_service.pb.h"
#include "tracelens/v1/log_service.pb.h"
