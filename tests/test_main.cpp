#include <gtest/gtest.h>

#include <QCoreApplication>

// QProcess 与 QTimer 需要一个应用对象来驱动事件循环
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
