#pragma once

#include "sitepull/core/v1/cursor.pb.h"
#include "sitepull/core/v1/jobs.pb.h"
#include "sitepull/core/v1/types.pb.h"

#include "sitepull/services/v1/database_job_service.pb.h"
#include "sitepull/services/v1/export_service.pb.h"
#include "sitepull/services/v1/file_service.pb.h"
#include "sitepull/services/v1/manifest_service.pb.h"

#include "sitepull/services/v1/database_job_service.grpc.pb.h"
#include "sitepull/services/v1/export_service.grpc.pb.h"
#include "sitepull/services/v1/file_service.grpc.pb.h"
#include "sitepull/services/v1/manifest_service.grpc.pb.h"

namespace sitepull::v1 {
using namespace ::sitepull::core::v1;
using namespace ::sitepull::services::v1;
}
