#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "shopstore/v1.hpp"
#include "tests/support/shop_fixture.hpp"

namespace {

using shopstore::testing::MakeShop;
using shopstore::testing::ShopFixture;

namespace v1 = shopstore::v1;

shopstore::service::ServiceContext BuildServiceContext(const ShopFixture& f) {
  shopstore::service::ServiceContext ctx;
  ctx.manager = f.manager;
  return ctx;
}

void TestGetMissingShopReturnsNotFound() {
  ShopFixture                    f("grpc_not_found");
  shopstore::grpc::CatalogServer server(std::make_shared<shopstore::service::CatalogService>(BuildServiceContext(f)));

  v1::GetShopRequest req;
  req.set_id("missing-shop");
  v1::GetShopResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetShop(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCreateAndDuplicate() {
  ShopFixture                    f("grpc_duplicate");
  shopstore::grpc::CatalogServer server(std::make_shared<shopstore::service::CatalogService>(BuildServiceContext(f)));

  v1::CreateShopRequest req;
  *req.mutable_shop() = MakeShop("alice-shop", "0xABC", "Alice's Goods");
  v1::CreateShopResponse resp;

  ::grpc::ServerContext first;
  assert(server.CreateShop(&first, &req, &resp).ok());
  assert(resp.shop().id() == "alice-shop");

  ::grpc::ServerContext second;
  assert(server.CreateShop(&second, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  req.mutable_shop()->set_id("a/b");
  ::grpc::ServerContext third;
  assert(server.CreateShop(&third, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCloseUnopenedDatabaseReturnsFailedPrecondition() {
  ShopFixture                  f("grpc_not_open");
  shopstore::grpc::AdminServer server(std::make_shared<shopstore::service::AdminService>(BuildServiceContext(f)));

  v1::CloseDatabaseRequest req;
  req.set_shop_id("never-opened");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.CloseDatabase(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestExceptionMapping() {
  using namespace shopstore::util;

  assert(shopstore::grpc::ToStatus(StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(shopstore::grpc::ToStatus(AggregateError("x", {"a: b"})).error_code() == ::grpc::StatusCode::ABORTED);
  assert(shopstore::grpc::ToStatus(Cancelled("x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(shopstore::grpc::ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(shopstore::grpc::ToStatus(StorageError("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(shopstore::grpc::ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestGetMissingShopReturnsNotFound();
  TestCreateAndDuplicate();
  TestCloseUnopenedDatabaseReturnsFailedPrecondition();
  TestExceptionMapping();

  std::cout << "shopstore_unit_grpc_status: pass\n";
  return 0;
}
