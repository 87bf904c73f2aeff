// Every check in this suite is a static_assert; linking is the test.
int main() {
    return 0;
}
