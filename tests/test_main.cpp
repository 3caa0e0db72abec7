#include <QApplication>

#include <gtest/gtest.h>

int main(int argc, char *argv[])
{
	// fonts and graphics items need a gui application, no display is needed
	qputenv("QT_QPA_PLATFORM", "offscreen");
	QApplication app(argc, argv);
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
