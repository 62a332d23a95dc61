#pragma once

/*
  Aggregate include for the public plancast.v1 API.
*/

#include "plancast/v1/types.pb.h"

#include "plancast/v1/project_service.pb.h"
#include "plancast/v1/project_service.grpc.pb.h"
