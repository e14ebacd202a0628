#pragma once

#include "shopstore/core/v1/shop.pb.h"

#include "shopstore/services/v1/shop_admin_service.pb.h"
#include "shopstore/services/v1/shop_catalog_service.pb.h"

namespace shopstore::v1 {
using namespace ::shopstore::core::v1;
using namespace ::shopstore::services::v1;
}
