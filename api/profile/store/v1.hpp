#pragma once

#include "profile/store/v1/document.pb.h"
#include "profile/store/v1/sink_service.pb.h"
#include "profile/store/v1/store_service.pb.h"

#ifdef PROFILE_WITH_GRPC
#include "profile/store/v1/sink_service.grpc.pb.h"
#include "profile/store/v1/store_service.grpc.pb.h"
#endif
