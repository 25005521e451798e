#pragma once

#include "mirrorsync/v1/types.pb.h"

#include "mirrorsync/v1/admin_service.pb.h"
#include "mirrorsync/v1/mirror_service.pb.h"
#include "mirrorsync/v1/origin_service.pb.h"

#include "mirrorsync/v1/admin_service.grpc.pb.h"
#include "mirrorsync/v1/mirror_service.grpc.pb.h"
#include "mirrorsync/v1/origin_service.grpc.pb.h"
