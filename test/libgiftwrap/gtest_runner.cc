#include <gtest/gtest.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/init.h>

#include <iostream>

int main(int argc, char **argv) {
   ::testing::InitGoogleTest(&argc, argv);
   if (gwInitConfig(*_config) == false)
      return 42;
   int const result = RUN_ALL_TESTS();
   if (_error->empty() == false)
   {
      std::cerr << "The test generated the following global messages:" << std::endl;
      _error->DumpErrors(std::cerr);
      // messages on the stack can't be right, error out
      // even if we have no idea where this message came from
      if (result == 0)
      {
	 std::cerr << "All tests successful, but messages were generated, so still a failure!" << std::endl;
	 return 29;
      }
   }
   return result;
}
