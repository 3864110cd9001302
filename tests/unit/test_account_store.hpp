#pragma once

namespace paystream::tests {

void test_account_store_lazy_creation();
void test_account_store_concurrent_writers();

}  // namespace paystream::tests
